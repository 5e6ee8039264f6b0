#pragma once

#include <string_view>

#include <NGIN/Dispatch/Export.hpp>
#include <NGIN/Dispatch/Types.hpp>
#include <NGIN/Dispatch/Log.hpp>
#include <NGIN/Dispatch/Signature.hpp>
#include <NGIN/Dispatch/TypeCatalog.hpp>
#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Matcher.hpp>
#include <NGIN/Dispatch/Resolver.hpp>
#include <NGIN/Dispatch/Invoker.hpp>
#include <NGIN/Dispatch/Registry.hpp>
#include <NGIN/Dispatch/Implementation.hpp>
#include <NGIN/Dispatch/RegistrationGroup.hpp>

namespace NGIN::Dispatch
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Dispatch"; }

} // namespace NGIN::Dispatch
