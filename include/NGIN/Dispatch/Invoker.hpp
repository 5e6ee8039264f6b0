// Invoker.hpp
// Runs a resolved entry's implementation
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <span>

#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  /// Attributes a bound implementation sees: the entry's metadata (only when `entry.bindMetadata`)
  /// followed by `overrides`, with an override replacing metadata of the same name.
  [[nodiscard]] NGIN_DISPATCH_API NGIN::Containers::Vector<AttributeDesc>
  BindAttributes(const Entry &entry, std::span<const AttributeDesc> overrides);

  // Returns the implementation's value or error unchanged; exceptions propagate. No retries, no timeouts.
  // Plain implementations ignore `overrides`.
  [[nodiscard]] NGIN_DISPATCH_API std::expected<Any, Error> Invoke(const Entry &entry,
                                                                   std::span<const Any> args,
                                                                   std::span<const AttributeDesc> overrides = {});

} // namespace NGIN::Dispatch
