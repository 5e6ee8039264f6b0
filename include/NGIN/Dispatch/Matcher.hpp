// Matcher.hpp
// Applicability test and per-position specificity scoring for one entry
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <optional>
#include <span>
#include <utility>

#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/TypeCatalog.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  // How one argument satisfied its constraint. Higher ranks are more specific.
  enum class MatchRank : NGIN::UInt8
  {
    Predicate = 0,
    Subtype = 1,
    Exact = 2,
  };

  struct ParamScore
  {
    MatchRank rank{MatchRank::Predicate};
    // Inheritance steps for Subtype; zero otherwise.
    NGIN::UInt32 distance{0};
  };

  // One ParamScore per argument position, compared left to right.
  using Specificity = NGIN::Containers::Vector<ParamScore>;

  struct MatchResult
  {
    bool matched{false};
    Specificity specificity{};
    DiagnosticCode code{DiagnosticCode::None};
    NGIN::UIntSize argIndex{static_cast<NGIN::UIntSize>(-1)};
  };

  /// Negative when `a` is less specific than `b`, zero on a tie, positive when more specific.
  [[nodiscard]] NGIN_DISPATCH_API int CompareParam(const ParamScore &a, const ParamScore &b) noexcept;

  /// Lexicographic: the first differing position decides. Both vectors must have the same length.
  [[nodiscard]] NGIN_DISPATCH_API int CompareSpecificity(const Specificity &a, const Specificity &b) noexcept;

  [[nodiscard]] NGIN_DISPATCH_API std::optional<ParamScore> MatchParam(const Constraint &constraint,
                                                                        const Any &arg,
                                                                        const TypeCatalogView &catalog);

  [[nodiscard]] NGIN_DISPATCH_API MatchResult Match(const Entry &entry,
                                                    std::span<const Any> args,
                                                    const TypeCatalogView &catalog);

  [[nodiscard]] inline std::optional<Specificity> Matches(const Entry &entry,
                                                          std::span<const Any> args,
                                                          const TypeCatalogView &catalog)
  {
    auto r = Match(entry, args, catalog);
    if (!r.matched)
      return std::nullopt;
    return std::move(r.specificity);
  }

} // namespace NGIN::Dispatch
