// TypeCatalog.hpp
// Runtime type hierarchy that SubtypeOf constraints are checked against
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  namespace detail
  {
    struct BaseEdge
    {
      TypeId baseTypeId{0};
      const void *(*Upcast)(const void *){nullptr};
    };

    struct TypeRecord
    {
      TypeId typeId{0};
      std::string name{};
      NGIN::Containers::Vector<BaseEdge> bases{};
    };

    // Immutable once published; replaced wholesale on every declaration.
    struct TypeTable
    {
      NGIN::Containers::Vector<TypeRecord> types;
      NGIN::Containers::FlatHashMap<TypeId, NGIN::UInt32> byTypeId;
    };

    template <class Derived, class Base>
    static const void *UpcastConst(const void *obj)
    {
      return static_cast<const void *>(static_cast<const Base *>(static_cast<const Derived *>(obj)));
    }
  } // namespace detail

  // Read-only view of one published catalog state. Cheap to copy.
  class NGIN_DISPATCH_API TypeCatalogView
  {
  public:
    TypeCatalogView() = default;
    explicit TypeCatalogView(std::shared_ptr<const detail::TypeTable> table) : m_table(std::move(table)) {}

    [[nodiscard]] bool IsKnown(TypeId typeId) const noexcept;
    [[nodiscard]] NGIN::UIntSize TypeCount() const noexcept;
    // Empty for undeclared types.
    [[nodiscard]] std::string_view NameOf(TypeId typeId) const noexcept;

    // 0 when have == want, the shortest declared inheritance path otherwise, nullopt when unrelated.
    [[nodiscard]] std::optional<NGIN::UInt32> SubtypeDistance(TypeId have, TypeId want) const;

    // Applies the upcast chain from `have` to `want`; nullptr when unrelated.
    [[nodiscard]] const void *UpcastPtr(const void *obj, TypeId have, TypeId want) const;

    template <class Base>
    [[nodiscard]] const Base *Upcast(const Any &value) const
    {
      const void *p = UpcastPtr(static_cast<const void *>(value.Data()), value.GetTypeId(), detail::TypeIdOf<Base>());
      return static_cast<const Base *>(p);
    }

  private:
    [[nodiscard]] bool FindPath(TypeId have,
                                TypeId want,
                                NGIN::Containers::Vector<const detail::BaseEdge *> &path) const;

    std::shared_ptr<const detail::TypeTable> m_table{};
  };

  /**
   * Owner of the declared hierarchy. Declarations publish a fresh immutable
   * table; readers take a TypeCatalogView and never block writers for longer
   * than a pointer copy.
   */
  class NGIN_DISPATCH_API TypeCatalog
  {
  public:
    TypeCatalog();
    TypeCatalog(const TypeCatalog &) = delete;
    TypeCatalog &operator=(const TypeCatalog &) = delete;

    /** Declare a type tag. Re-declaring renames it. */
    template <class T>
    void Declare(std::string_view name = {})
    {
      DeclareId(detail::TypeIdOf<T>(), name.empty() ? detail::DisplayNameOf<T>() : name, true);
    }

    /** Declare `Derived : Base`; both types are declared if missing. */
    template <class Derived, class Base>
    requires (std::is_base_of_v<Base, Derived> && !std::is_same_v<std::remove_cv_t<Base>, std::remove_cv_t<Derived>>)
    void DeclareBase()
    {
      DeclareBaseId(detail::TypeIdOf<Derived>(),
                    detail::DisplayNameOf<Derived>(),
                    detail::TypeIdOf<Base>(),
                    detail::DisplayNameOf<Base>(),
                    &detail::UpcastConst<Derived, Base>);
    }

    [[nodiscard]] TypeCatalogView Snapshot() const;

    [[nodiscard]] bool IsKnown(TypeId typeId) const { return Snapshot().IsKnown(typeId); }
    [[nodiscard]] std::optional<NGIN::UInt32> SubtypeDistance(TypeId have, TypeId want) const
    {
      return Snapshot().SubtypeDistance(have, want);
    }

    template <class Derived, class Base>
    [[nodiscard]] bool IsSubtype() const
    {
      return SubtypeDistance(detail::TypeIdOf<Derived>(), detail::TypeIdOf<Base>()).has_value();
    }

  private:
    void DeclareId(TypeId typeId, std::string_view name, bool rename);
    void DeclareBaseId(TypeId derived,
                       std::string_view derivedName,
                       TypeId base,
                       std::string_view baseName,
                       const void *(*upcast)(const void *));

    mutable std::shared_mutex m_mutex;
    std::shared_ptr<const detail::TypeTable> m_table;
  };

} // namespace NGIN::Dispatch
