#include <NGIN/Dispatch/RegistrationGroup.hpp>
#include <NGIN/Dispatch/Log.hpp>

#include <string>
#include <utility>

namespace NGIN::Dispatch
{

  RegistrationGroup::~RegistrationGroup()
  {
    (void)Release();
  }

  RegistrationGroup::RegistrationGroup(RegistrationGroup &&other) noexcept
      : m_registry(other.m_registry), m_moduleName(std::move(other.m_moduleName)), m_handles(std::move(other.m_handles))
  {
    other.m_registry = nullptr;
    other.m_handles = {};
  }

  RegistrationGroup &RegistrationGroup::operator=(RegistrationGroup &&other) noexcept
  {
    if (this != &other)
    {
      (void)Release();
      m_registry = other.m_registry;
      m_moduleName = std::move(other.m_moduleName);
      m_handles = std::move(other.m_handles);
      other.m_registry = nullptr;
      other.m_handles = {};
    }
    return *this;
  }

  std::expected<EntryHandle, Error> RegistrationGroup::Register(std::string_view key,
                                                                Signature signature,
                                                                Implementation implementation,
                                                                RegisterOptions options)
  {
    if (!m_registry)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "moved-from registration group"});
    auto handle = m_registry->Register(key, std::move(signature), std::move(implementation), std::move(options));
    if (handle)
      m_handles.PushBack(*handle);
    return handle;
  }

  std::expected<EntryHandle, Error> RegistrationGroup::Register(std::string_view key,
                                                                Signature signature,
                                                                BoundImplementation implementation,
                                                                RegisterOptions options)
  {
    if (!m_registry)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "moved-from registration group"});
    auto handle = m_registry->Register(key, std::move(signature), std::move(implementation), std::move(options));
    if (handle)
      m_handles.PushBack(*handle);
    return handle;
  }

  NGIN::UIntSize RegistrationGroup::Release()
  {
    if (!m_registry)
      return 0;
    NGIN::UIntSize released = 0;
    for (NGIN::UIntSize i = 0; i < m_handles.Size(); ++i)
    {
      if (m_registry->Unregister(m_handles[i]))
        ++released;
    }
    m_handles = {};
    if (released != 0)
    {
      detail::LogLazy(LogLevel::Debug, [&] {
        return "released " + std::to_string(released) + " entries of " + m_moduleName;
      });
    }
    return released;
  }

} // namespace NGIN::Dispatch
