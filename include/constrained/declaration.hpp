#ifndef CONSTRAINED_DECLARATION_HPP
#define CONSTRAINED_DECLARATION_HPP

#include <cstddef>
#include <optional>
#include <type_traits>
#include <vector>

#include <constrained/element.hpp>
#include <constrained/type_set.hpp>

namespace constrained {

// --- Derivation declarations ---

// Unresolved type parameter: the allowed set is decided per instance
struct Placeholder {};

// Explicit tuple of allowed types. Constraints<> declares nothing.
template <typename... Ts> struct Constraints {
    static constexpr std::size_t size = sizeof...(Ts);
    static TypeSet set() { return TypeSet::of<Ts...>(); }
};

template <typename T>
inline constexpr bool is_placeholder_v = std::is_same_v<T, Placeholder>;

namespace detail {

template <typename T> struct is_constraints : std::false_type {};
template <typename... Ts>
struct is_constraints<Constraints<Ts...>> : std::true_type {};

} // namespace detail

template <typename T>
inline constexpr bool is_constraints_v = detail::is_constraints<T>::value;

// Class-level allowed set:
//   1. a non-empty Declared tuple wins outright
//   2. otherwise a concrete Param is the sole allowed type
//   3. otherwise std::nullopt (open, resolved per instance)
template <typename Param, typename Declared = Constraints<>>
std::optional<TypeSet> declared_constraints() {
    static_assert(is_constraints_v<Declared>,
                  "derivation configuration must be Constraints<Ts...>");
    if constexpr (Declared::size > 0)
        return Declared::set();
    else if constexpr (!is_placeholder_v<Param>)
        return TypeSet::of<Param>();
    else
        return std::nullopt;
}

// --- Instance-level resolution ---

// Distinct runtime types of a batch
inline TypeSet infer_constraints(const std::vector<Element>& batch) {
    TypeSet result;
    for (const auto& e : batch)
        result = result.with(e.type());
    return result;
}

// Explicit override > concrete class-level declaration > inferred from the
// batch. An explicit set is honoured even when empty.
inline TypeSet resolve_constraints(const std::vector<Element>& batch,
                                   const std::optional<TypeSet>& explicit_set,
                                   const std::optional<TypeSet>& declared) {
    if (explicit_set)
        return *explicit_set;
    if (declared)
        return *declared;
    return infer_constraints(batch);
}

} // namespace constrained

#endif // CONSTRAINED_DECLARATION_HPP
