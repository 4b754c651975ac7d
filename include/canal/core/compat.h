#ifndef CANAL_CORE_COMPAT_H
#define CANAL_CORE_COMPAT_H

// Vocabulary type aliases so that code reads canal::optional / canal::variant
// throughout the tree.

#include <any>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>

namespace canal {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using monostate = std::monostate;
using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

using any = std::any;
using std::any_cast;

}  // namespace canal

#endif  // CANAL_CORE_COMPAT_H
