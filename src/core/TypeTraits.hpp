// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_TYPE_TRAITS_HPP_INCLUDED
#define NFD_CORE_TYPE_TRAITS_HPP_INCLUDED

#include <nfd/core/Global.hpp>

#include <type_traits>
#include <utility>

namespace nfd {
namespace core {

namespace type_traits_internal {
template <typename FRef, typename Signature, typename=void> struct is_callable_as :
  std::false_type {};
template <typename FRef, typename Result, typename... Args> struct is_callable_as<FRef,
  Result(Args...), typename std::enable_if<std::is_convertible<decltype(std::declval<FRef>()(
  std::declval<Args>()...)), Result>::value>::type> : std::true_type {};
}

// Whether FRef can be invoked with the parameter types of Signature, producing something
// convertible to its result type
template <typename FRef, typename Signature> constexpr bool IsCallableAs() {
  return type_traits_internal::is_callable_as<FRef, Signature>::value;
}

template <bool Condition> using requires_t = typename std::enable_if<Condition, int>::type;

}}

// Constrains a function template; DECL goes on the declaration, DEF on an out-of-class definition
#define NFD_FUNCDECL_REQUIRES(...) ::nfd::core::requires_t<(__VA_ARGS__)> = 0
#define NFD_FUNCDEF_REQUIRES(...) ::nfd::core::requires_t<(__VA_ARGS__)>

#endif
