#include <NGIN/Dispatch/Matcher.hpp>

namespace NGIN::Dispatch
{

  int CompareParam(const ParamScore &a, const ParamScore &b) noexcept
  {
    if (a.rank != b.rank)
      return static_cast<int>(a.rank) < static_cast<int>(b.rank) ? -1 : 1;
    if (a.rank == MatchRank::Subtype && a.distance != b.distance)
      return a.distance > b.distance ? -1 : 1;
    return 0;
  }

  int CompareSpecificity(const Specificity &a, const Specificity &b) noexcept
  {
    const auto n = a.Size() < b.Size() ? a.Size() : b.Size();
    for (NGIN::UIntSize i = 0; i < n; ++i)
    {
      if (const int c = CompareParam(a[i], b[i]); c != 0)
        return c;
    }
    return 0;
  }

  std::optional<ParamScore> MatchParam(const Constraint &constraint, const Any &arg, const TypeCatalogView &catalog)
  {
    switch (constraint.Kind())
    {
      case ConstraintKind::Exact:
        if (arg.GetTypeId() == constraint.GetTypeId())
          return ParamScore{MatchRank::Exact, 0};
        return std::nullopt;
      case ConstraintKind::SubtypeOf:
      {
        auto d = catalog.SubtypeDistance(arg.GetTypeId(), constraint.GetTypeId());
        if (!d)
          return std::nullopt;
        if (*d == 0)
          return ParamScore{MatchRank::Exact, 0};
        return ParamScore{MatchRank::Subtype, *d};
      }
      case ConstraintKind::Predicate:
        if (constraint.TestPredicate(arg))
          return ParamScore{MatchRank::Predicate, 0};
        return std::nullopt;
      default: break;
    }
    return std::nullopt;
  }

  MatchResult Match(const Entry &entry, std::span<const Any> args, const TypeCatalogView &catalog)
  {
    MatchResult result{};
    const auto &sig = entry.signature;
    if (sig.Arity() != args.size())
    {
      result.code = DiagnosticCode::ArityMismatch;
      return result;
    }
    result.specificity.Reserve(args.size());
    for (NGIN::UIntSize i = 0; i < args.size(); ++i)
    {
      auto score = MatchParam(sig.At(i), args[i], catalog);
      if (!score)
      {
        result.code = DiagnosticCode::ConstraintFailed;
        result.argIndex = i;
        result.specificity = {};
        return result;
      }
      result.specificity.PushBack(*score);
    }
    result.matched = true;
    return result;
  }

} // namespace NGIN::Dispatch
