#include <NGIN/Dispatch/Invoker.hpp>
#include <NGIN/Dispatch/Log.hpp>

#include <string>

namespace NGIN::Dispatch
{

  NGIN::Containers::Vector<AttributeDesc> BindAttributes(const Entry &entry, std::span<const AttributeDesc> overrides)
  {
    NGIN::Containers::Vector<AttributeDesc> bound;
    if (entry.bindMetadata)
    {
      bound.Reserve(entry.metadata.Size() + overrides.size());
      for (NGIN::UIntSize i = 0; i < entry.metadata.Size(); ++i)
        bound.PushBack(entry.metadata[i]);
    }
    else
    {
      bound.Reserve(overrides.size());
    }
    for (const auto &o : overrides)
    {
      bool replaced = false;
      for (NGIN::UIntSize i = 0; i < bound.Size(); ++i)
      {
        if (bound[i].key == o.key)
        {
          bound[i].value = o.value;
          replaced = true;
          break;
        }
      }
      if (!replaced)
        bound.PushBack(o);
    }
    return bound;
  }

  std::expected<Any, Error> Invoke(const Entry &entry, std::span<const Any> args, std::span<const AttributeDesc> overrides)
  {
    detail::LogLazy(LogLevel::Debug, [&] {
      return "dispatch " + entry.keyName + entry.signature.ToString() + " #" + std::to_string(entry.sequence);
    });
    if (entry.implementation)
      return entry.implementation(args);
    if (entry.boundImplementation)
    {
      const auto bound = BindAttributes(entry, overrides);
      return entry.boundImplementation(args, detail::AsSpan(bound));
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "entry has no implementation"});
  }

} // namespace NGIN::Dispatch
