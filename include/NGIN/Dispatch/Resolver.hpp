// Resolver.hpp
// Picks the single most specific applicable entry, or reports why there is none
#pragma once

#include <expected>
#include <span>

#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/TypeCatalog.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  /**
   * Resolve `args` against `entries`.
   *
   * - `NoMatch` when no entry applies; diagnostics hold one record per entry
   *   explaining the rejection (arity or first failing position).
   * - `AmbiguousDispatch` when the highest specificity is shared; diagnostics
   *   name every tied entry. Registration order never breaks a tie.
   */
  [[nodiscard]] NGIN_DISPATCH_API std::expected<EntryPtr, Error> Resolve(const EntryList &entries,
                                                                         std::span<const Any> args,
                                                                         const TypeCatalogView &catalog);

} // namespace NGIN::Dispatch
