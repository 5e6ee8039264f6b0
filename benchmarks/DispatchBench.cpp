
#include <array>
#include <iostream>
#include <string>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Dispatch/Dispatch.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Shape
  {
    int id{0};
  };
  struct Polygon : Shape
  {
    int sides{4};
  };
  struct Square : Polygon
  {
    float side{1.0f};
  };

  inline int Area(const Square &s) { return static_cast<int>(s.side * s.side); }
}

int main()
{
  using namespace NGIN::Dispatch;
  using namespace BenchDemo;

  Registry reg{RegistryOptions{"bench"}};
  reg.Types().DeclareBase<Polygon, Shape>();
  reg.Types().DeclareBase<Square, Polygon>();

  (void)reg.Register("exact", Signature::Of<Square>(), MakeImplementation(&Area));
  (void)reg.Register("subtype", Signature{Constraint::SubtypeOf<Shape>("Shape")},
                     [](std::span<const Any>) -> std::expected<Any, Error> { return Any{1}; });
  // Eight candidates, only the last one applies.
  for (int i = 0; i < 7; ++i)
  {
    const std::string name = "p" + std::to_string(i);
    (void)reg.Register("wide", Signature{Constraint::Predicate(name, [](const Any &) { return false; })},
                       [](std::span<const Any>) -> std::expected<Any, Error> { return Any{0}; });
  }
  (void)reg.Register("wide", Signature::Of<Square>(), MakeImplementation(&Area));

  std::array<Any, 1> args{Any{Square{}}};
  const std::span<const Any> view{args.data(), args.size()};

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = reg.Dispatch("exact", view).value();
      sum += out.Cast<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Dispatch exact (Square) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = reg.Dispatch("subtype", view).value();
      sum += out.Cast<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Dispatch subtype (Shape+, distance 2) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = reg.Dispatch("wide", view).value();
      sum += out.Cast<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Dispatch 8 candidates 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    auto resolved = reg.Resolve("wide", view).value();
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      auto out = resolved.Invoke(view).value();
      sum += out.Cast<int>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Invoke pre-resolved 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Square s{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += Area(s);
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct Area 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    for (int i=0;i<1000;++i) {
      auto h = reg.Register("churn", Signature::Of<int>(),
                            [](std::span<const Any>) -> std::expected<Any, Error> { return Any{0}; });
      if (h)
        (void)reg.Unregister(*h);
    }
    ctx.stop(); }, "Register+Unregister 1k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
