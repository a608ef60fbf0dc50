#ifndef FSESL_COMPAT_H
#define FSESL_COMPAT_H

// Aliases for std::optional/variant in the fsesl namespace. The library is
// built as C++17, so the standard implementations are always available.

#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>

namespace fsesl {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

// Import std functions into fsesl namespace for ADL
using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace fsesl

#endif  // FSESL_COMPAT_H
