#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Invoker.hpp>
#include <NGIN/Dispatch/Log.hpp>
#include <NGIN/Dispatch/Resolver.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace NGIN::Dispatch
{

  namespace
  {
    constexpr std::string_view kUnknownKey = "unknown key";
    constexpr std::string_view kDuplicate = "identical signature already registered";
    constexpr std::string_view kEmptyKey = "empty key";
    constexpr std::string_view kNoImplementation = "empty implementation";
    constexpr std::string_view kMalformedSignature = "predicate constraint without name or callable";
    constexpr std::string_view kInternFailed = "key interning failed";

    std::atomic<RegistryId> g_nextRegistryId{1};

    EntrySnapshot EmptyList()
    {
      return std::make_shared<const EntryList>();
    }
  } // namespace

  std::expected<Any, Error> ResolvedEntry::Invoke(std::span<const Any> args,
                                                  std::span<const AttributeDesc> overrides) const
  {
    if (!m_entry)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty resolved entry"});
    return ::NGIN::Dispatch::Invoke(*m_entry, args, overrides);
  }

  Registry::Registry(RegistryOptions options)
      : m_name(options.name),
        m_id(g_nextRegistryId.fetch_add(1, std::memory_order_relaxed)),
        m_bindMetadata(options.bindMetadata),
        m_strings(std::make_shared<StringStore>())
  {
  }

  const Registry::KeySlot *Registry::FindSlot(std::string_view key) const
  {
    StringInterner::IdType id{};
    if (!m_keys.TryGetId(key, id))
      return nullptr;
    return m_slots.GetPtr(static_cast<KeyId>(id));
  }

  AttributeDesc Registry::InternAttribute(const AttributeDesc &attr)
  {
    AttributeDesc out{};
    out.key = m_strings->Intern(attr.key);
    if (const auto *s = std::get_if<std::string_view>(&attr.value))
      out.value = m_strings->Intern(*s);
    else
      out.value = attr.value;
    return out;
  }

  std::expected<EntryHandle, Error> Registry::Register(std::string_view key,
                                                       Signature signature,
                                                       Implementation implementation,
                                                       RegisterOptions options)
  {
    if (!implementation)
      return std::unexpected(Error{ErrorCode::InvalidArgument, kNoImplementation});
    return RegisterEntry(key, std::move(signature), std::move(implementation), {}, std::move(options));
  }

  std::expected<EntryHandle, Error> Registry::Register(std::string_view key,
                                                       Signature signature,
                                                       BoundImplementation implementation,
                                                       RegisterOptions options)
  {
    if (!implementation)
      return std::unexpected(Error{ErrorCode::InvalidArgument, kNoImplementation});
    return RegisterEntry(key, std::move(signature), {}, std::move(implementation), std::move(options));
  }

  std::expected<EntryHandle, Error> Registry::RegisterEntry(std::string_view key,
                                                            Signature signature,
                                                            Implementation implementation,
                                                            BoundImplementation boundImplementation,
                                                            RegisterOptions options)
  {
    if (key.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kEmptyKey});
    if (!signature.IsWellFormed())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kMalformedSignature});

    EntryHandle handle{};
    NGIN::UInt64 retired = 0;
    std::string text = signature.ToString();
    {
      std::unique_lock lock{m_mutex};
      const auto rawId = m_keys.InsertOrGet(key);
      if (rawId == StringInterner::INVALID_ID)
        return std::unexpected(Error{ErrorCode::InvalidArgument, kInternFailed});
      const auto keyId = static_cast<KeyId>(rawId);

      auto *slot = m_slots.GetPtr(keyId);
      if (!slot)
      {
        m_slots.Insert(keyId, KeySlot{m_keys.View(rawId), EmptyList()});
        m_keyOrder.PushBack(keyId);
        slot = m_slots.GetPtr(keyId);
      }

      const EntryList &current = *slot->entries;
      NGIN::UIntSize replaced = current.Size();
      for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
      {
        if (!current[i]->signature.IsIdentical(signature))
          continue;
        if (!options.override)
        {
          NGIN::Containers::Vector<CandidateDiagnostic> diags;
          CandidateDiagnostic d{};
          d.signature = current[i]->signature.ToString();
          d.sequence = current[i]->sequence;
          d.arity = current[i]->signature.Arity();
          d.code = DiagnosticCode::Duplicate;
          diags.PushBack(std::move(d));
          return std::unexpected(Error{ErrorCode::DuplicateRegistration, kDuplicate, std::move(diags)});
        }
        replaced = i;
        retired = current[i]->sequence;
        break;
      }

      auto entry = std::make_shared<Entry>();
      entry->key = keyId;
      entry->keyName = std::string{slot->name};
      entry->signature = std::move(signature);
      entry->implementation = std::move(implementation);
      entry->boundImplementation = std::move(boundImplementation);
      entry->sequence = m_nextSequence++;
      entry->isOverride = options.override;
      entry->bindMetadata = m_bindMetadata;
      entry->strings = m_strings;
      entry->metadata.Reserve(options.metadata.Size());
      for (NGIN::UIntSize i = 0; i < options.metadata.Size(); ++i)
        entry->metadata.PushBack(InternAttribute(options.metadata[i]));

      auto next = std::make_shared<EntryList>();
      next->Reserve(current.Size() + 1);
      for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
      {
        if (i != replaced)
          next->PushBack(current[i]);
      }
      handle = EntryHandle{m_id, keyId, entry->sequence};
      next->PushBack(std::move(entry));
      slot->entries = std::move(next);
    }

    detail::LogLazy(LogLevel::Debug, [&] {
      std::string msg = "register " + std::string{key} + text + " #" + std::to_string(handle.sequence);
      if (retired != 0)
        msg += " (overrides #" + std::to_string(retired) + ")";
      return msg;
    });
    return handle;
  }

  bool Registry::Unregister(EntryHandle handle)
  {
    if (!handle.IsValid() || handle.registry != m_id)
      return false;
    {
      std::unique_lock lock{m_mutex};
      auto *slot = m_slots.GetPtr(handle.key);
      if (!slot)
        return false;
      const EntryList &current = *slot->entries;
      NGIN::UIntSize found = current.Size();
      for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
      {
        if (current[i]->sequence == handle.sequence)
        {
          found = i;
          break;
        }
      }
      if (found == current.Size())
        return false;
      auto next = std::make_shared<EntryList>();
      next->Reserve(current.Size() - 1);
      for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
      {
        if (i != found)
          next->PushBack(current[i]);
      }
      slot->entries = std::move(next);
    }
    detail::LogLazy(LogLevel::Debug, [&] { return "unregister #" + std::to_string(handle.sequence); });
    return true;
  }

  bool Registry::IsRegistered(EntryHandle handle) const
  {
    if (!handle.IsValid() || handle.registry != m_id)
      return false;
    std::shared_lock lock{m_mutex};
    const auto *slot = m_slots.GetPtr(handle.key);
    if (!slot)
      return false;
    const EntryList &current = *slot->entries;
    for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
    {
      if (current[i]->sequence == handle.sequence)
        return true;
    }
    return false;
  }

  std::expected<NGIN::UIntSize, Error> Registry::Remove(std::string_view key)
  {
    NGIN::UIntSize removed = 0;
    {
      std::unique_lock lock{m_mutex};
      StringInterner::IdType id{};
      if (!m_keys.TryGetId(key, id))
        return std::unexpected(Error{ErrorCode::UnknownKey, kUnknownKey});
      auto *slot = m_slots.GetPtr(static_cast<KeyId>(id));
      if (!slot)
        return std::unexpected(Error{ErrorCode::UnknownKey, kUnknownKey});
      removed = slot->entries->Size();
      slot->entries = EmptyList();
    }
    detail::LogLazy(LogLevel::Debug, [&] {
      return "remove " + std::string{key} + " (" + std::to_string(removed) + " entries)";
    });
    return removed;
  }

  std::expected<EntrySnapshot, Error> Registry::Lookup(std::string_view key) const
  {
    std::shared_lock lock{m_mutex};
    const auto *slot = FindSlot(key);
    if (!slot)
      return std::unexpected(Error{ErrorCode::UnknownKey, kUnknownKey});
    return slot->entries;
  }

  bool Registry::Contains(std::string_view key) const
  {
    std::shared_lock lock{m_mutex};
    const auto *slot = FindSlot(key);
    return slot && slot->entries->Size() != 0;
  }

  NGIN::UIntSize Registry::KeyCount() const
  {
    std::shared_lock lock{m_mutex};
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < m_keyOrder.Size(); ++i)
    {
      const auto *slot = m_slots.GetPtr(m_keyOrder[i]);
      if (slot && slot->entries->Size() != 0)
        ++n;
    }
    return n;
  }

  NGIN::UIntSize Registry::EntryCount() const
  {
    std::shared_lock lock{m_mutex};
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < m_keyOrder.Size(); ++i)
    {
      if (const auto *slot = m_slots.GetPtr(m_keyOrder[i]))
        n += slot->entries->Size();
    }
    return n;
  }

  NGIN::Containers::Vector<std::string_view> Registry::AvailableKeys() const
  {
    std::vector<std::string_view> names;
    {
      std::shared_lock lock{m_mutex};
      names.reserve(m_keyOrder.Size());
      for (NGIN::UIntSize i = 0; i < m_keyOrder.Size(); ++i)
      {
        const auto *slot = m_slots.GetPtr(m_keyOrder[i]);
        if (slot && slot->entries->Size() != 0)
          names.push_back(slot->name);
      }
    }
    std::sort(names.begin(), names.end());
    NGIN::Containers::Vector<std::string_view> out;
    out.Reserve(names.size());
    for (auto n : names)
      out.PushBack(n);
    return out;
  }

  std::expected<NGIN::Containers::Vector<std::string>, Error> Registry::Signatures(std::string_view key) const
  {
    auto snapshot = Lookup(key);
    if (!snapshot)
      return std::unexpected(snapshot.error());
    const EntryList &entries = **snapshot;
    NGIN::Containers::Vector<std::string> out;
    out.Reserve(entries.Size());
    for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
      out.PushBack(entries[i]->signature.ToString());
    return out;
  }

  std::expected<NGIN::Containers::Vector<EntryInfo>, Error> Registry::Describe(std::string_view key) const
  {
    auto snapshot = Lookup(key);
    if (!snapshot)
      return std::unexpected(snapshot.error());
    const EntryList &entries = **snapshot;
    NGIN::Containers::Vector<EntryInfo> out;
    out.Reserve(entries.Size());
    for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
    {
      const auto &e = *entries[i];
      EntryInfo info{};
      info.signature = e.signature.ToString();
      info.arity = e.signature.Arity();
      info.isOverride = e.isOverride;
      info.metadata = e.metadata;
      info.strings = e.strings;
      out.PushBack(std::move(info));
    }
    return out;
  }

  std::string Registry::Describe() const
  {
    const auto keys = AvailableKeys();
    std::string out = "Registry(name=" + m_name + ", keys=[";
    for (NGIN::UIntSize i = 0; i < keys.Size(); ++i)
    {
      if (i != 0)
        out += ", ";
      out += keys[i];
    }
    out += "])";
    return out;
  }

  std::expected<ResolvedEntry, Error> Registry::Resolve(std::string_view key, std::span<const Any> args) const
  {
    auto snapshot = Lookup(key);
    std::expected<EntryPtr, Error> winner = std::unexpected(Error{ErrorCode::UnknownKey, kUnknownKey});
    if (snapshot)
      winner = ::NGIN::Dispatch::Resolve(**snapshot, args, m_types.Snapshot());
    if (!winner)
    {
      detail::LogLazy(LogLevel::Trace, [&] {
        return "resolve " + std::string{key} + " failed: " + std::string{ToString(winner.error().code)};
      });
      return std::unexpected(std::move(winner.error()));
    }
    return ResolvedEntry{std::move(*winner)};
  }

  std::expected<Any, Error> Registry::Dispatch(std::string_view key,
                                               std::span<const Any> args,
                                               std::span<const AttributeDesc> overrides) const
  {
    auto resolved = Resolve(key, args);
    if (!resolved)
      return std::unexpected(std::move(resolved.error()));
    return resolved->Invoke(args, overrides);
  }

} // namespace NGIN::Dispatch
