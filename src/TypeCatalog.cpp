#include <NGIN/Dispatch/TypeCatalog.hpp>
#include <NGIN/Dispatch/Log.hpp>

#include <mutex>

namespace NGIN::Dispatch
{

  namespace
  {
    constexpr NGIN::UInt32 kNoIndex = static_cast<NGIN::UInt32>(-1);

    std::shared_ptr<detail::TypeTable> CloneTable(const detail::TypeTable &src)
    {
      auto next = std::make_shared<detail::TypeTable>();
      next->types = src.types;
      for (NGIN::UIntSize i = 0; i < next->types.Size(); ++i)
        next->byTypeId.Insert(next->types[i].typeId, static_cast<NGIN::UInt32>(i));
      return next;
    }

    NGIN::UInt32 EnsureRecord(detail::TypeTable &table, TypeId typeId, std::string_view name, bool rename)
    {
      if (auto *p = table.byTypeId.GetPtr(typeId))
      {
        if (rename && !name.empty())
          table.types[*p].name = std::string{name};
        return *p;
      }
      detail::TypeRecord rec{};
      rec.typeId = typeId;
      rec.name = std::string{name};
      const auto idx = static_cast<NGIN::UInt32>(table.types.Size());
      table.types.PushBack(std::move(rec));
      table.byTypeId.Insert(typeId, idx);
      return idx;
    }
  } // namespace

  bool TypeCatalogView::IsKnown(TypeId typeId) const noexcept
  {
    return m_table && m_table->byTypeId.GetPtr(typeId) != nullptr;
  }

  NGIN::UIntSize TypeCatalogView::TypeCount() const noexcept
  {
    return m_table ? m_table->types.Size() : 0;
  }

  std::string_view TypeCatalogView::NameOf(TypeId typeId) const noexcept
  {
    if (!m_table)
      return {};
    if (const auto *p = m_table->byTypeId.GetPtr(typeId))
      return m_table->types[*p].name;
    return {};
  }

  bool TypeCatalogView::FindPath(TypeId have,
                                 TypeId want,
                                 NGIN::Containers::Vector<const detail::BaseEdge *> &path) const
  {
    if (have == want)
      return true;
    if (!m_table)
      return false;
    const auto *start = m_table->byTypeId.GetPtr(have);
    if (!start)
      return false;

    // Breadth-first so the first hit is the shortest path through the declared bases.
    struct Node
    {
      NGIN::UInt32 typeIndex;
      NGIN::UInt32 parent;
      const detail::BaseEdge *edge;
    };
    NGIN::Containers::Vector<Node> nodes;
    nodes.PushBack(Node{*start, kNoIndex, nullptr});
    for (NGIN::UIntSize cursor = 0; cursor < nodes.Size(); ++cursor)
    {
      const auto typeIndex = nodes[cursor].typeIndex;
      const auto &rec = m_table->types[typeIndex];
      if (rec.typeId == want)
      {
        NGIN::Containers::Vector<const detail::BaseEdge *> reversed;
        for (auto n = static_cast<NGIN::UInt32>(cursor); nodes[n].parent != kNoIndex; n = nodes[n].parent)
          reversed.PushBack(nodes[n].edge);
        path.Reserve(reversed.Size());
        for (NGIN::UIntSize i = reversed.Size(); i > 0; --i)
          path.PushBack(reversed[i - 1]);
        return true;
      }
      for (NGIN::UIntSize b = 0; b < rec.bases.Size(); ++b)
      {
        const auto &edge = rec.bases[b];
        const auto *baseIndex = m_table->byTypeId.GetPtr(edge.baseTypeId);
        if (!baseIndex)
          continue;
        bool seen = false;
        for (NGIN::UIntSize k = 0; k < nodes.Size(); ++k)
        {
          if (nodes[k].typeIndex == *baseIndex)
          {
            seen = true;
            break;
          }
        }
        if (!seen)
          nodes.PushBack(Node{*baseIndex, static_cast<NGIN::UInt32>(cursor), &edge});
      }
    }
    return false;
  }

  std::optional<NGIN::UInt32> TypeCatalogView::SubtypeDistance(TypeId have, TypeId want) const
  {
    NGIN::Containers::Vector<const detail::BaseEdge *> path;
    if (!FindPath(have, want, path))
      return std::nullopt;
    return static_cast<NGIN::UInt32>(path.Size());
  }

  const void *TypeCatalogView::UpcastPtr(const void *obj, TypeId have, TypeId want) const
  {
    if (!obj)
      return nullptr;
    NGIN::Containers::Vector<const detail::BaseEdge *> path;
    if (!FindPath(have, want, path))
      return nullptr;
    const void *p = obj;
    for (NGIN::UIntSize i = 0; i < path.Size(); ++i)
    {
      if (!path[i]->Upcast)
        return nullptr;
      p = path[i]->Upcast(p);
    }
    return p;
  }

  TypeCatalog::TypeCatalog() : m_table(std::make_shared<const detail::TypeTable>()) {}

  TypeCatalogView TypeCatalog::Snapshot() const
  {
    std::shared_lock lock{m_mutex};
    return TypeCatalogView{m_table};
  }

  void TypeCatalog::DeclareId(TypeId typeId, std::string_view name, bool rename)
  {
    {
      std::unique_lock lock{m_mutex};
      auto next = CloneTable(*m_table);
      (void)EnsureRecord(*next, typeId, name, rename);
      m_table = std::move(next);
    }
    detail::LogLazy(LogLevel::Debug, [&] { return "declared type " + std::string{name}; });
  }

  void TypeCatalog::DeclareBaseId(TypeId derived,
                                  std::string_view derivedName,
                                  TypeId base,
                                  std::string_view baseName,
                                  const void *(*upcast)(const void *))
  {
    {
      std::unique_lock lock{m_mutex};
      auto next = CloneTable(*m_table);
      (void)EnsureRecord(*next, base, baseName, false);
      const auto idx = EnsureRecord(*next, derived, derivedName, false);
      auto &bases = next->types[idx].bases;
      bool present = false;
      for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
      {
        if (bases[i].baseTypeId == base)
        {
          present = true;
          break;
        }
      }
      if (!present)
        bases.PushBack(detail::BaseEdge{base, upcast});
      m_table = std::move(next);
    }
    detail::LogLazy(LogLevel::Debug, [&] {
      return "declared base " + std::string{derivedName} + " : " + std::string{baseName};
    });
  }

} // namespace NGIN::Dispatch
