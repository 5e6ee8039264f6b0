#include <NGIN/Dispatch/Dispatch.hpp>

#include <array>
#include <iostream>
#include <string>

namespace Demo {
  struct Shape { std::string label; };
  struct Circle : Shape { double r{0}; };
  struct Square : Shape { double side{0}; };
}

namespace {
  void Report(const NGIN::Dispatch::Registry &reg, std::string_view what, NGIN::Dispatch::Any arg)
  {
    using namespace NGIN::Dispatch;
    std::array<Any, 1> args{std::move(arg)};
    auto out = reg.Dispatch("area", args.data(), args.size());
    std::cout << "area(" << what << ") -> ";
    if (!out) {
      std::cout << ToString(out.error().code) << ": " << out.error().message << "\n";
      for (NGIN::UIntSize i = 0; i < out.error().diagnostics.Size(); ++i)
        std::cout << "    candidate " << out.error().diagnostics[i].signature << "\n";
      return;
    }
    if (out->GetTypeId() == detail::TypeIdOf<double>())
      std::cout << out->Cast<double>() << "\n";
    else
      std::cout << out->Cast<std::string>() << "\n";
  }
}

int main() {
  using namespace NGIN::Dispatch;
  using namespace Demo;
  std::cout << "Library: " << LibraryName() << "\n";

  Registry reg{RegistryOptions{"geometry"}};
  reg.Types().DeclareBase<Circle, Shape>();
  reg.Types().DeclareBase<Square, Shape>();

  auto circle = reg.Register("area", Signature::Of<Circle>(),
                             MakeImplementation([](const Circle &c) { return 3.141592653589793 * c.r * c.r; }));
  auto generic = reg.Register("area", Signature{Constraint::SubtypeOf<Shape>("Shape")},
                              [&reg](std::span<const Any> args) -> std::expected<Any, Error> {
                                const Shape *s = reg.Types().Snapshot().Upcast<Shape>(args[0]);
                                return Any{std::string{"generic area of "} + s->label};
                              });
  if (!circle || !generic) {
    std::cerr << "registration failed\n";
    return 1;
  }

  std::cout << reg.Describe() << "\n";
  auto sigs = reg.Signatures("area");
  for (NGIN::UIntSize i = 0; sigs && i < sigs->Size(); ++i)
    std::cout << "  area" << (*sigs)[i] << "\n";

  Circle c{};
  c.r = 2.0;
  Square sq{};
  sq.label = "square";
  sq.side = 3.0;
  Report(reg, "Circle(r=2)", Any{c});
  Report(reg, "Square", Any{sq});
  Report(reg, "42", Any{42});

  reg.Unregister(*circle);
  Report(reg, "Circle(r=2) after unregister", Any{c});
  return 0;
}
