// Entry.hpp
// Immutable registration record shared between registry snapshots
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <NGIN/Dispatch/Signature.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  // Receives exactly the dispatched arguments. Errors and exceptions are passed through to the caller untouched.
  using Implementation = std::function<std::expected<Any, Error>(std::span<const Any>)>;

  /**
   * Implementation that also receives bound attributes: the entry's metadata when
   * the registry binds metadata, with the caller's per-call attributes taking
   * precedence over metadata of the same name.
   */
  using BoundImplementation =
      std::function<std::expected<Any, Error>(std::span<const Any>, std::span<const AttributeDesc>)>;

  // Backing text for metadata views. Shared by the registry and its entries.
  using StringStore = NGIN::Utilities::StringInterner<>;
  using StringStorePtr = std::shared_ptr<const StringStore>;

  struct Entry
  {
    KeyId key{static_cast<KeyId>(-1)};
    std::string keyName{};
    Signature signature{};
    // Exactly one of the two is set.
    Implementation implementation{};
    BoundImplementation boundImplementation{};
    NGIN::UInt64 sequence{0};
    bool isOverride{false};
    bool bindMetadata{false};
    NGIN::Containers::Vector<AttributeDesc> metadata{};
    // Keeps metadata string views valid after the registry is gone.
    StringStorePtr strings{};
  };

  using EntryPtr = std::shared_ptr<const Entry>;
  using EntryList = NGIN::Containers::Vector<EntryPtr>;
  // Never null for a known key; empty once every entry has been unregistered.
  using EntrySnapshot = std::shared_ptr<const EntryList>;

} // namespace NGIN::Dispatch
