// Types.hpp
// Public-facing error codes, diagnostics and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace NGIN::Dispatch
{

  using Any = NGIN::Utilities::Any<>;
  using KeyId = NGIN::UInt32;
  using TypeId = NGIN::UInt64;
  using RegistryId = NGIN::UInt32;

  enum class ErrorCode : unsigned
  {
    UnknownKey = 1,
    NoMatch = 2,
    AmbiguousDispatch = 3,
    DuplicateRegistration = 4,
    InvalidArgument = 5,
    // Reserved for implementations reporting their own failures; never produced by the core.
    ImplementationFailed = 6,
  };

  [[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::UnknownKey: return "UnknownKey";
      case ErrorCode::NoMatch: return "NoMatch";
      case ErrorCode::AmbiguousDispatch: return "AmbiguousDispatch";
      case ErrorCode::DuplicateRegistration: return "DuplicateRegistration";
      case ErrorCode::InvalidArgument: return "InvalidArgument";
      case ErrorCode::ImplementationFailed: return "ImplementationFailed";
      default: break;
    }
    return "Unknown";
  }

  enum class DiagnosticCode : unsigned
  {
    None = 0,
    ArityMismatch = 1,
    ConstraintFailed = 2,
    Tied = 3,
    Duplicate = 4,
  };

  // One candidate entry as seen by a failed registration or dispatch.
  struct CandidateDiagnostic
  {
    std::string signature{};
    NGIN::UInt64 sequence{0};
    NGIN::UIntSize arity{0};
    DiagnosticCode code{DiagnosticCode::None};
    NGIN::UIntSize argIndex{static_cast<NGIN::UIntSize>(-1)};
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    NGIN::Containers::Vector<CandidateDiagnostic> diagnostics{};

    constexpr Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, NGIN::Containers::Vector<CandidateDiagnostic> d)
        : code(c), message(m), diagnostics(std::move(d))
    {
    }
  };

  // Public attribute value type for entry metadata
  using AttrValue = std::variant<bool, std::int64_t, double, std::string_view, NGIN::UInt64>;

  struct AttributeDesc
  {
    std::string_view key;
    AttrValue value;
  };

  // Last attribute named `key`, or nullptr.
  [[nodiscard]] inline const AttrValue *FindAttribute(std::span<const AttributeDesc> attrs, std::string_view key) noexcept
  {
    for (std::size_t i = attrs.size(); i > 0; --i)
    {
      if (attrs[i - 1].key == key)
        return &attrs[i - 1].value;
    }
    return nullptr;
  }

  // Empty when the attribute is missing or holds another alternative.
  template <class T>
  [[nodiscard]] std::optional<T> GetAttribute(std::span<const AttributeDesc> attrs, std::string_view key)
  {
    const AttrValue *v = FindAttribute(attrs, key);
    if (!v)
      return std::nullopt;
    if (const T *p = std::get_if<T>(v))
      return *p;
    return std::nullopt;
  }

  // Returned by registration. Refers to exactly one entry of one registry; inert once that entry is gone.
  struct EntryHandle
  {
    RegistryId registry{0};
    KeyId key{static_cast<KeyId>(-1)};
    NGIN::UInt64 sequence{0};
    constexpr bool IsValid() const noexcept { return registry != 0 && sequence != 0; }
  };

  using ExpectedAny = std::expected<Any, Error>;

  namespace detail
  {
    template <class T>
    [[nodiscard]] inline std::span<const T> AsSpan(const NGIN::Containers::Vector<T> &v) noexcept
    {
      if (v.Size() == 0)
        return {};
      return std::span<const T>{&v[0], v.Size()};
    }

    // FNV-1a of the qualified type name; matches Any::GetTypeId().
    template <class T>
    inline TypeId TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    inline std::string_view DisplayNameOf()
    {
      return NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::unqualifiedName;
    }
  } // namespace detail

} // namespace NGIN::Dispatch
