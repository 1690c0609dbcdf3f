#ifndef DEEPRESEARCH_COMPAT_H
#define DEEPRESEARCH_COMPAT_H

// Vocabulary types used across the project. The build requires C++17, so
// these resolve to the standard library versions.

#include <optional>
#include <variant>

namespace deepresearch {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;
using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace deepresearch

#endif  // DEEPRESEARCH_COMPAT_H
