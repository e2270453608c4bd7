#ifndef CONSTRAINED_MARKER_HPP
#define CONSTRAINED_MARKER_HPP

#include <concepts>
#include <optional>
#include <type_traits>

#include <constrained/type_set.hpp>

namespace constrained {

class Element;

// --- Capability marker ---

// Interface for types that expose an allowed-type set but do their own
// checking. Inheriting from it is optional: conformance is structural.
class IsConstrained {
  public:
    virtual ~IsConstrained() = default;
    virtual const TypeSet& constraints() const = 0;
};

// Instance-level contract: `t.constraints()` yields a TypeSet
template <typename T>
concept exposes_constraints = requires(const T& t) {
    { t.constraints() } -> std::convertible_to<const TypeSet&>;
};

// Class-level contract: the type itself declares its allowed set, or
// std::nullopt when it is resolved per instance
template <typename T>
concept is_constrained_type = requires {
    { T::declared() } -> std::same_as<std::optional<TypeSet>>;
};

// Structural only: registered foreign types (see Registry) do not conform.
// The runtime overload for type-erased values lives in element.hpp.
template <typename T> constexpr bool conforms() {
    return exposes_constraints<std::remove_cvref_t<T>>;
}

template <typename T>
    requires(!std::is_same_v<std::remove_cvref_t<T>, Element>)
constexpr bool conforms(const T&) {
    return conforms<T>();
}

} // namespace constrained

#endif // CONSTRAINED_MARKER_HPP
