// Signature.hpp
// Per-argument constraints (exact type, subtype, predicate) and ordered signatures
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  enum class ConstraintKind : NGIN::UInt8
  {
    Exact = 0,
    SubtypeOf = 1,
    Predicate = 2,
  };

  using PredicateFn = std::function<bool(const Any &)>;

  class NGIN_DISPATCH_API Constraint
  {
  public:
    Constraint() = default;

    template <class T>
    [[nodiscard]] static Constraint Exact(std::string_view name = {})
    {
      return ExactId(detail::TypeIdOf<T>(), name.empty() ? detail::DisplayNameOf<T>() : name);
    }

    // Accepts T and every type declared as deriving from T in the registry's catalog.
    template <class T>
    [[nodiscard]] static Constraint SubtypeOf(std::string_view name = {})
    {
      return SubtypeOfId(detail::TypeIdOf<T>(), name.empty() ? detail::DisplayNameOf<T>() : name);
    }

    [[nodiscard]] static Constraint ExactId(TypeId typeId, std::string_view name);
    [[nodiscard]] static Constraint SubtypeOfId(TypeId typeId, std::string_view name);
    // The name is the predicate's identity: two predicates with the same name are the same constraint.
    [[nodiscard]] static Constraint Predicate(std::string_view name, PredicateFn fn);

    [[nodiscard]] ConstraintKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] TypeId GetTypeId() const noexcept { return m_typeId; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }

    [[nodiscard]] bool IsWellFormed() const noexcept;
    [[nodiscard]] bool IsIdentical(const Constraint &other) const noexcept;
    [[nodiscard]] bool TestPredicate(const Any &value) const;

    // "Circle", "Shape+" or "?positive"
    [[nodiscard]] std::string ToString() const;

  private:
    ConstraintKind m_kind{ConstraintKind::Exact};
    TypeId m_typeId{0};
    std::string m_name{};
    PredicateFn m_predicate{};
  };

  class NGIN_DISPATCH_API Signature
  {
  public:
    Signature() = default;
    Signature(std::initializer_list<Constraint> constraints);

    template <class... T>
    [[nodiscard]] static Signature Of()
    {
      Signature s;
      s.m_constraints.Reserve(sizeof...(T));
      (s.m_constraints.PushBack(Constraint::Exact<T>()), ...);
      return s;
    }

    Signature &Add(Constraint constraint);

    [[nodiscard]] NGIN::UIntSize Arity() const noexcept { return m_constraints.Size(); }
    [[nodiscard]] const Constraint &At(NGIN::UIntSize i) const { return m_constraints[i]; }

    [[nodiscard]] bool IsWellFormed() const noexcept;
    [[nodiscard]] bool IsIdentical(const Signature &other) const noexcept;
    [[nodiscard]] std::string ToString() const;

  private:
    NGIN::Containers::Vector<Constraint> m_constraints{};
  };

} // namespace NGIN::Dispatch
