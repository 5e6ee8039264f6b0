#include <NGIN/Dispatch/Dispatch.hpp>

#include <array>
#include <cctype>
#include <cstdint>
#include <expected>
#include <span>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {
  using namespace NGIN::Dispatch;

  std::string Strip(const std::string &x)
  {
    const auto first = x.find_first_not_of(" \t\n");
    if (first == std::string::npos)
      return {};
    const auto last = x.find_last_not_of(" \t\n");
    return x.substr(first, last - first + 1);
  }

  std::string ToUpper(std::string x)
  {
    for (auto &ch : x)
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return x;
  }

  // Word `index` of a single-space separated line; empty when out of range.
  std::string NthWord(const std::string &x, std::size_t index)
  {
    std::size_t start = 0;
    for (std::size_t i = 0; i < index; ++i) {
      start = x.find(' ', start);
      if (start == std::string::npos)
        return std::string{};
      ++start;
    }
    return x.substr(start, x.find(' ', start) - start);
  }

  // One implementation for every getword-N key; N comes from the bound "index" attribute.
  std::expected<Any, Error> GetWord(std::span<const Any> args, std::span<const AttributeDesc> attrs)
  {
    if (args.size() != 1 || args[0].GetTypeId() != detail::TypeIdOf<std::string>())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "getword expects one string"});
    const auto index = GetAttribute<std::int64_t>(attrs, "index").value_or(0);
    if (index < 0)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "negative word index"});
    return Any{NthWord(args[0].Cast<std::string>(), static_cast<std::size_t>(index))};
  }

  bool RegisterGetWord(Registry &reg, std::string_view key, std::int64_t index)
  {
    RegisterOptions opts{};
    opts.metadata.PushBack(AttributeDesc{"index", index});
    return reg.Register(key, Signature::Of<std::string>(), BoundImplementation{&GetWord}, std::move(opts)).has_value();
  }
}

int main() {
  Registry reg{RegistryOptions{"string", true}};
  if (!reg.Register("strip", Signature::Of<std::string>(), MakeImplementation(&Strip)) ||
      !RegisterGetWord(reg, "getword-0", 0) || !RegisterGetWord(reg, "getword-1", 1) ||
      !reg.Register("upper", Signature::Of<std::string>(), MakeImplementation(&ToUpper))) {
    std::cerr << "registration failed\n";
    return 1;
  }
  std::cout << reg.Describe() << "\n";

  const std::vector<std::string> lines{" nuke the site from orbit...", "only way to be sure "};
  const std::array<std::string_view, 3> pipeline{"strip", "getword-1", "upper"};

  std::vector<std::string> output;
  for (auto line : lines) {
    for (auto step : pipeline) {
      auto out = reg.DispatchAs<std::string>(step, line);
      if (!out) {
        std::cerr << step << ": " << ToString(out.error().code) << "\n";
        return 1;
      }
      line = std::move(*out);
    }
    output.push_back(line);
  }

  // Prints [THE, WAY]
  std::cout << "[";
  for (std::size_t i = 0; i < output.size(); ++i)
    std::cout << (i ? ", " : "") << output[i];
  std::cout << "]\n";

  // A call-time attribute replaces the bound index for this call only. Prints "orbit..."
  const std::array<Any, 1> args{Any{Strip(lines[0])}};
  const std::array<AttributeDesc, 1> fifth{AttributeDesc{"index", std::int64_t{4}}};
  auto word = reg.Dispatch("getword-1", args, fifth);
  if (!word) {
    std::cerr << "getword-1: " << ToString(word.error().code) << "\n";
    return 1;
  }
  std::cout << word->Cast<std::string>() << "\n";
  return 0;
}
