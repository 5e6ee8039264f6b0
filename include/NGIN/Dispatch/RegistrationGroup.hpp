#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Registry.hpp>

namespace NGIN::Dispatch
{

  /**
   * Registrations made on behalf of one module or plugin. Every handle obtained
   * through the group is released together, either explicitly through
   * `Release()` or when the group is destroyed. The registry must outlive the
   * group.
   */
  class NGIN_DISPATCH_API RegistrationGroup
  {
  public:
    RegistrationGroup(Registry &registry, std::string_view moduleName)
        : m_registry(&registry), m_moduleName(moduleName)
    {
    }
    ~RegistrationGroup();

    RegistrationGroup(const RegistrationGroup &) = delete;
    RegistrationGroup &operator=(const RegistrationGroup &) = delete;
    RegistrationGroup(RegistrationGroup &&other) noexcept;
    RegistrationGroup &operator=(RegistrationGroup &&other) noexcept;

    [[nodiscard]] std::string_view ModuleName() const noexcept { return m_moduleName; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_handles.Size(); }

    [[nodiscard]] std::expected<EntryHandle, Error> Register(std::string_view key,
                                                             Signature signature,
                                                             Implementation implementation,
                                                             RegisterOptions options = {});
    [[nodiscard]] std::expected<EntryHandle, Error> Register(std::string_view key,
                                                             Signature signature,
                                                             BoundImplementation implementation,
                                                             RegisterOptions options = {});

    /** Unregister everything registered through this group; returns how many entries were still live. */
    NGIN::UIntSize Release();

  private:
    Registry *m_registry{nullptr};
    std::string m_moduleName{};
    NGIN::Containers::Vector<EntryHandle> m_handles{};
  };

} // namespace NGIN::Dispatch
