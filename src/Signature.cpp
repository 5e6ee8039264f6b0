#include <NGIN/Dispatch/Signature.hpp>

namespace NGIN::Dispatch
{

  Constraint Constraint::ExactId(TypeId typeId, std::string_view name)
  {
    Constraint c;
    c.m_kind = ConstraintKind::Exact;
    c.m_typeId = typeId;
    c.m_name = std::string{name};
    return c;
  }

  Constraint Constraint::SubtypeOfId(TypeId typeId, std::string_view name)
  {
    Constraint c;
    c.m_kind = ConstraintKind::SubtypeOf;
    c.m_typeId = typeId;
    c.m_name = std::string{name};
    return c;
  }

  Constraint Constraint::Predicate(std::string_view name, PredicateFn fn)
  {
    Constraint c;
    c.m_kind = ConstraintKind::Predicate;
    c.m_name = std::string{name};
    c.m_predicate = std::move(fn);
    return c;
  }

  bool Constraint::IsWellFormed() const noexcept
  {
    if (m_kind == ConstraintKind::Predicate)
      return !m_name.empty() && static_cast<bool>(m_predicate);
    return true;
  }

  bool Constraint::IsIdentical(const Constraint &other) const noexcept
  {
    if (m_kind != other.m_kind)
      return false;
    if (m_kind == ConstraintKind::Predicate)
      return m_name == other.m_name;
    return m_typeId == other.m_typeId;
  }

  bool Constraint::TestPredicate(const Any &value) const
  {
    if (!m_predicate)
      return false;
    return m_predicate(value);
  }

  std::string Constraint::ToString() const
  {
    switch (m_kind)
    {
      case ConstraintKind::Exact: return m_name;
      case ConstraintKind::SubtypeOf: return m_name + "+";
      case ConstraintKind::Predicate: return "?" + m_name;
      default: break;
    }
    return m_name;
  }

  Signature::Signature(std::initializer_list<Constraint> constraints)
  {
    m_constraints.Reserve(constraints.size());
    for (const auto &c : constraints)
      m_constraints.PushBack(c);
  }

  Signature &Signature::Add(Constraint constraint)
  {
    m_constraints.PushBack(std::move(constraint));
    return *this;
  }

  bool Signature::IsWellFormed() const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_constraints.Size(); ++i)
    {
      if (!m_constraints[i].IsWellFormed())
        return false;
    }
    return true;
  }

  bool Signature::IsIdentical(const Signature &other) const noexcept
  {
    if (m_constraints.Size() != other.m_constraints.Size())
      return false;
    for (NGIN::UIntSize i = 0; i < m_constraints.Size(); ++i)
    {
      if (!m_constraints[i].IsIdentical(other.m_constraints[i]))
        return false;
    }
    return true;
  }

  std::string Signature::ToString() const
  {
    std::string out{"("};
    for (NGIN::UIntSize i = 0; i < m_constraints.Size(); ++i)
    {
      if (i != 0)
        out += ", ";
      out += m_constraints[i].ToString();
    }
    out += ")";
    return out;
  }

} // namespace NGIN::Dispatch
