#include <NGIN/Dispatch/Resolver.hpp>
#include <NGIN/Dispatch/Matcher.hpp>

#include <utility>

namespace NGIN::Dispatch
{

  namespace
  {
    constexpr std::string_view kNoMatch = "no applicable entry";
    constexpr std::string_view kAmbiguous = "ambiguous dispatch";

    CandidateDiagnostic Describe(const Entry &e, DiagnosticCode code, NGIN::UIntSize argIndex)
    {
      CandidateDiagnostic d{};
      d.signature = e.signature.ToString();
      d.sequence = e.sequence;
      d.arity = e.signature.Arity();
      d.code = code;
      d.argIndex = argIndex;
      return d;
    }

    struct Viable
    {
      NGIN::UIntSize entryIndex;
      Specificity specificity;
    };
  } // namespace

  std::expected<EntryPtr, Error> Resolve(const EntryList &entries,
                                         std::span<const Any> args,
                                         const TypeCatalogView &catalog)
  {
    NGIN::Containers::Vector<Viable> viable;
    NGIN::Containers::Vector<CandidateDiagnostic> rejected;
    for (NGIN::UIntSize k = 0; k < entries.Size(); ++k)
    {
      const auto &e = *entries[k];
      auto r = Match(e, args, catalog);
      if (!r.matched)
      {
        rejected.PushBack(Describe(e, r.code, r.argIndex));
        continue;
      }
      viable.PushBack(Viable{k, std::move(r.specificity)});
    }

    if (viable.Size() == 0)
      return std::unexpected(Error{ErrorCode::NoMatch, kNoMatch, std::move(rejected)});

    NGIN::UIntSize best = 0;
    for (NGIN::UIntSize i = 1; i < viable.Size(); ++i)
    {
      if (CompareSpecificity(viable[i].specificity, viable[best].specificity) > 0)
        best = i;
    }

    NGIN::Containers::Vector<CandidateDiagnostic> tied;
    for (NGIN::UIntSize i = 0; i < viable.Size(); ++i)
    {
      if (CompareSpecificity(viable[i].specificity, viable[best].specificity) == 0)
        tied.PushBack(Describe(*entries[viable[i].entryIndex], DiagnosticCode::Tied, static_cast<NGIN::UIntSize>(-1)));
    }
    if (tied.Size() > 1)
      return std::unexpected(Error{ErrorCode::AmbiguousDispatch, kAmbiguous, std::move(tied)});

    return entries[viable[best].entryIndex];
  }

} // namespace NGIN::Dispatch
