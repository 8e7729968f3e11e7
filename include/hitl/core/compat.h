#ifndef HITL_CORE_COMPAT_H
#define HITL_CORE_COMPAT_H

// The project builds as C++17; optional and variant resolve to the std
// versions under the hitl namespace so call sites read the same everywhere.

#include <cstddef>
#include <optional>
#include <variant>

namespace hitl {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace hitl

#endif  // HITL_CORE_COMPAT_H
