// Registry.hpp
// Key -> entries mapping with copy-on-write snapshots, and the dispatch entry points
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <array>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Signature.hpp>
#include <NGIN/Dispatch/TypeCatalog.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  struct RegistryOptions
  {
    std::string_view name{"default"};
    // Pass each entry's metadata to bound implementations on every call.
    bool bindMetadata{false};
  };

  struct RegisterOptions
  {
    // Replace an entry with an identical signature instead of failing.
    bool override{false};
    NGIN::Containers::Vector<AttributeDesc> metadata{};
  };

  // Introspection record; carries no sequence number.
  struct EntryInfo
  {
    std::string signature{};
    NGIN::UIntSize arity{0};
    bool isOverride{false};
    NGIN::Containers::Vector<AttributeDesc> metadata{};
    StringStorePtr strings{};
  };

  // Outcome of Resolve(). Keeps its entry alive, so it stays invocable after the entry is unregistered.
  class ResolvedEntry
  {
  public:
    ResolvedEntry() = default;
    explicit ResolvedEntry(EntryPtr entry) : m_entry(std::move(entry)) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_entry != nullptr; }
    [[nodiscard]] const Entry &GetEntry() const { return *m_entry; }
    [[nodiscard]] const Signature &GetSignature() const { return m_entry->signature; }
    [[nodiscard]] NGIN::UIntSize ArgumentCount() const { return m_entry ? m_entry->signature.Arity() : 0; }

    [[nodiscard]] NGIN_DISPATCH_API std::expected<Any, Error> Invoke(std::span<const Any> args,
                                                                     std::span<const AttributeDesc> overrides = {}) const;
    [[nodiscard]] std::expected<Any, Error> Invoke(const Any *args, NGIN::UIntSize count) const
    {
      return Invoke(std::span<const Any>{args, count});
    }

  private:
    EntryPtr m_entry{};
  };

  /**
   * An explicit, independently scoped dispatch registry.
   *
   * Mutations (Register, Unregister, Remove) run under an exclusive lock and
   * publish a new immutable entry list for the touched key. Readers hold a
   * shared lock only while copying that list's pointer; matching, resolution
   * and invocation run unlocked against the copied snapshot.
   */
  class NGIN_DISPATCH_API Registry
  {
  public:
    explicit Registry(RegistryOptions options = {});
    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] RegistryId Id() const noexcept { return m_id; }
    [[nodiscard]] bool BindsMetadata() const noexcept { return m_bindMetadata; }

    // Hierarchy used by SubtypeOf constraints.
    [[nodiscard]] TypeCatalog &Types() noexcept { return m_types; }
    [[nodiscard]] const TypeCatalog &Types() const noexcept { return m_types; }

    // Registration
    [[nodiscard]] std::expected<EntryHandle, Error> Register(std::string_view key,
                                                             Signature signature,
                                                             Implementation implementation,
                                                             RegisterOptions options = {});
    [[nodiscard]] std::expected<EntryHandle, Error> Register(std::string_view key,
                                                             Signature signature,
                                                             BoundImplementation implementation,
                                                             RegisterOptions options = {});
    // Idempotent; false when the handle is inert, foreign, or already unregistered.
    bool Unregister(EntryHandle handle);
    [[nodiscard]] bool IsRegistered(EntryHandle handle) const;
    // Unregisters every entry under `key`; the key stays known.
    std::expected<NGIN::UIntSize, Error> Remove(std::string_view key);

    // Lookup
    [[nodiscard]] std::expected<EntrySnapshot, Error> Lookup(std::string_view key) const;
    [[nodiscard]] bool Contains(std::string_view key) const;
    [[nodiscard]] NGIN::UIntSize KeyCount() const;
    [[nodiscard]] NGIN::UIntSize EntryCount() const;
    [[nodiscard]] NGIN::Containers::Vector<std::string_view> AvailableKeys() const;

    // Introspection
    [[nodiscard]] std::expected<NGIN::Containers::Vector<std::string>, Error> Signatures(std::string_view key) const;
    [[nodiscard]] std::expected<NGIN::Containers::Vector<EntryInfo>, Error> Describe(std::string_view key) const;
    [[nodiscard]] std::string Describe() const;

    // Dispatch
    [[nodiscard]] std::expected<ResolvedEntry, Error> Resolve(std::string_view key, std::span<const Any> args) const;
    // `overrides` reach bound implementations and win over metadata of the same name.
    [[nodiscard]] std::expected<Any, Error> Dispatch(std::string_view key,
                                                     std::span<const Any> args,
                                                     std::span<const AttributeDesc> overrides = {}) const;
    [[nodiscard]] std::expected<Any, Error> Dispatch(std::string_view key, const Any *args, NGIN::UIntSize count) const
    {
      return Dispatch(key, std::span<const Any>{args, count});
    }

    template <class R, class... A>
    [[nodiscard]] std::expected<R, Error> DispatchAs(std::string_view key, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Dispatch(key, std::span<const Any>{tmp.data(), tmp.size()});
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
      {
        return {};
      }
      else
      {
        if (r->GetTypeId() != detail::TypeIdOf<R>())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "result type mismatch"});
        return r->template Cast<std::remove_cvref_t<R>>();
      }
    }

  private:
    using StringInterner = NGIN::Utilities::StringInterner<>;

    struct KeySlot
    {
      std::string_view name{};
      EntrySnapshot entries{};
    };

    // Callers hold m_mutex (shared or exclusive).
    [[nodiscard]] const KeySlot *FindSlot(std::string_view key) const;
    [[nodiscard]] AttributeDesc InternAttribute(const AttributeDesc &attr);
    [[nodiscard]] std::expected<EntryHandle, Error> RegisterEntry(std::string_view key,
                                                                  Signature signature,
                                                                  Implementation implementation,
                                                                  BoundImplementation boundImplementation,
                                                                  RegisterOptions options);

    std::string m_name;
    RegistryId m_id{0};
    bool m_bindMetadata{false};
    TypeCatalog m_types;

    mutable std::shared_mutex m_mutex;
    mutable StringInterner m_keys;
    std::shared_ptr<StringStore> m_strings;
    NGIN::Containers::FlatHashMap<KeyId, KeySlot> m_slots;
    NGIN::Containers::Vector<KeyId> m_keyOrder;
    NGIN::UInt64 m_nextSequence{1};
  };

} // namespace NGIN::Dispatch
