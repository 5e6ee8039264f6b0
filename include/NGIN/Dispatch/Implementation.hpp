// Implementation.hpp
// Adapts strongly typed callables into type-erased implementations
#pragma once

#include <NGIN/Primitives.hpp>

#include <cstddef>
#include <expected>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>

#include <NGIN/Dispatch/Entry.hpp>
#include <NGIN/Dispatch/Types.hpp>

namespace NGIN::Dispatch
{

  namespace detail
  {
    template <class F>
    struct CallableTraits : CallableTraits<decltype(&F::operator())>
    {
    };

    template <class R, class... A>
    struct CallableTraits<R (*)(A...)>
    {
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) const> : CallableTraits<R (*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...)> : CallableTraits<R (*)(A...)>
    {
    };

    template <class T>
    inline constexpr bool IsUnboxableParam =
        !std::is_reference_v<T> || std::is_const_v<std::remove_reference_t<T>>;

    template <class T>
    inline bool ArgMatchesExact(const Any &arg)
    {
      return arg.GetTypeId() == TypeIdOf<T>();
    }

    template <class Traits, class F, std::size_t... I>
    std::expected<Any, Error> CallUnboxed(F &fn, std::span<const Any> args, std::index_sequence<I...>)
    {
      if (args.size() != sizeof...(I))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
      if (!(ArgMatchesExact<std::tuple_element_t<I, typename Traits::Args>>(args[I]) && ...))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "argument type mismatch"});
      using R = typename Traits::Ret;
      if constexpr (std::is_void_v<R>)
      {
        fn(args[I].template Cast<std::remove_cvref_t<std::tuple_element_t<I, typename Traits::Args>>>()...);
        return Any::MakeVoid();
      }
      else if constexpr (std::is_same_v<std::remove_cvref_t<R>, std::expected<Any, Error>>)
      {
        return fn(args[I].template Cast<std::remove_cvref_t<std::tuple_element_t<I, typename Traits::Args>>>()...);
      }
      else
      {
        std::remove_cvref_t<R> r =
            fn(args[I].template Cast<std::remove_cvref_t<std::tuple_element_t<I, typename Traits::Args>>>()...);
        return Any{std::move(r)};
      }
    }
  } // namespace detail

  /**
   * Wrap `fn(A...) -> R` as an Implementation. Each argument must hold exactly
   * the decayed parameter type, otherwise the call fails with InvalidArgument.
   * Parameters are taken by value or const reference. A callable returning
   * `std::expected<Any, Error>` has its outcome forwarded as is.
   */
  template <class F>
  [[nodiscard]] Implementation MakeImplementation(F fn)
  {
    using Fn = std::decay_t<F>;
    using Traits = detail::CallableTraits<Fn>;
    static_assert(
        []<std::size_t... I>(std::index_sequence<I...>) {
          return (detail::IsUnboxableParam<std::tuple_element_t<I, typename Traits::Args>> && ...);
        }(std::make_index_sequence<Traits::Arity>{}),
        "MakeImplementation parameters must be values or const references");
    return [fn = Fn(std::move(fn))](std::span<const Any> args) mutable -> std::expected<Any, Error> {
      return detail::CallUnboxed<Traits>(fn, args, std::make_index_sequence<Traits::Arity>{});
    };
  }

} // namespace NGIN::Dispatch
