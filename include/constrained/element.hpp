#ifndef CONSTRAINED_ELEMENT_HPP
#define CONSTRAINED_ELEMENT_HPP

#include <concepts>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include <constrained/errors.hpp>
#include <constrained/marker.hpp>
#include <constrained/type_set.hpp>

namespace constrained {

class Element;

namespace detail {

// --- Argument shapes ---

template <typename R>
concept string_like =
    std::is_convertible_v<const std::remove_cvref_t<R>&, std::string_view> ||
    std::is_convertible_v<const std::remove_cvref_t<R>&, std::wstring_view>;

// Anything that can be unpacked into a batch of elements. Strings are
// scalars here: a std::string is one element, not a run of chars.
template <typename R>
concept batch_range = std::ranges::input_range<const std::remove_cvref_t<R>> &&
                      !string_like<R> &&
                      !std::is_same_v<std::remove_cvref_t<R>, Element>;

// Reference-like wrappers (List::Slot) convert to the element they refer to
// instead of being wrapped themselves
template <typename T>
concept element_proxy =
    requires { typename std::remove_cvref_t<T>::element_proxy; };

template <typename T>
concept character = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                    std::is_same_v<T, char8_t> ||
                    std::is_same_v<T, char16_t> ||
                    std::is_same_v<T, char32_t>;

template <typename T>
concept repetition_count =
    std::integral<T> && !std::is_same_v<T, bool> && !character<T>;

// Saturates at the ptrdiff_t range instead of wrapping
template <repetition_count N> std::ptrdiff_t clamp_count(N n) {
    using limits = std::numeric_limits<std::ptrdiff_t>;
    if (std::cmp_greater(n, limits::max()))
        return limits::max();
    if (std::cmp_less(n, limits::min()))
        return limits::min();
    return static_cast<std::ptrdiff_t>(n);
}

// --- Type erasure ---

struct ElementConcept {
    virtual ~ElementConcept() = default;
    virtual std::unique_ptr<ElementConcept> clone() const = 0;
    virtual std::type_index type() const = 0;
    virtual bool equals(const ElementConcept& other) const = 0;
    virtual std::optional<TypeSet> constraints() const = 0;
    virtual bool is_batch() const = 0;
    virtual void unpack(std::vector<Element>& out) const = 0;
    virtual std::optional<std::ptrdiff_t> count() const = 0;
};

template <typename T> struct ElementModel;

} // namespace detail

// A single value of any copyable type together with its exact runtime type.
// Elements never hold "nothing": a moved-from element may only be assigned
// to or destroyed.
class Element {
  public:
    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, Element> &&
                 !detail::element_proxy<T>)
    Element(T&& value)
        : self_(std::make_unique<detail::ElementModel<detail::stored_t<T>>>(
              detail::stored_t<T>(std::forward<T>(value)))) {
        static_assert(!std::is_array_v<detail::stored_t<T>>,
                      "arrays are not elements; use a std::vector");
        static_assert(std::is_copy_constructible_v<detail::stored_t<T>>,
                      "element types must be copyable");
    }

    Element(const Element& other) : self_(other.self_->clone()) {}
    Element(Element&&) = default;

    Element& operator=(const Element& other) {
        if (this != &other)
            self_ = other.self_->clone();
        return *this;
    }
    Element& operator=(Element&&) = default;

    std::type_index type() const { return self_->type(); }

    template <typename T> bool holds() const {
        return type() == detail::type_id<T>();
    }

    template <typename T> const T* try_get() const {
        static_assert(std::is_same_v<T, detail::stored_t<T>>,
                      "request the stored type (strings are std::string)");
        if (!holds<T>())
            return nullptr;
        return &static_cast<const detail::ElementModel<T>&>(*self_).value;
    }

    template <typename T> const T& get() const {
        if (const T* p = try_get<T>())
            return *p;
        throw ElementCastError(typeid(T), type());
    }

    // Allowed set of the held value, if it exposes one
    std::optional<TypeSet> exposed_constraints() const {
        return self_->constraints();
    }

    // True if the held value can be unpacked into a batch
    bool is_batch() const { return self_->is_batch(); }
    std::optional<std::vector<Element>> unpack() const;

    // Held value as a repetition count, if it is a non-character integer
    std::optional<std::ptrdiff_t> repetition_count() const {
        return self_->count();
    }

    friend bool operator==(const Element& a, const Element& b) {
        return a.self_->equals(*b.self_);
    }

  private:
    std::unique_ptr<detail::ElementConcept> self_;
};

namespace detail {

template <typename T> struct ElementModel final : ElementConcept {
    T value;

    explicit ElementModel(T v) : value(std::move(v)) {}

    std::unique_ptr<ElementConcept> clone() const override {
        return std::make_unique<ElementModel>(value);
    }

    std::type_index type() const override { return typeid(T); }

    bool equals(const ElementConcept& other) const override {
        if (other.type() != type())
            return false;
        if constexpr (std::equality_comparable<T>)
            return value == static_cast<const ElementModel&>(other).value;
        else
            return this == &other;
    }

    std::optional<TypeSet> constraints() const override {
        if constexpr (exposes_constraints<T>)
            return TypeSet(value.constraints());
        else
            return std::nullopt;
    }

    bool is_batch() const override { return batch_range<T>; }

    void unpack(std::vector<Element>& out) const override {
        if constexpr (batch_range<T>) {
            for (const auto& v : value)
                out.emplace_back(v);
        }
    }

    std::optional<std::ptrdiff_t> count() const override {
        if constexpr (repetition_count<T>)
            return clamp_count(value);
        else
            return std::nullopt;
    }
};

} // namespace detail

inline std::optional<std::vector<Element>> Element::unpack() const {
    if (!is_batch())
        return std::nullopt;
    std::vector<Element> out;
    self_->unpack(out);
    return out;
}

// --- Capability queries on opaque values ---

// Runtime counterpart of conforms<T>(): true iff the held value exposes an
// allowed-type set. Structural only, the registry is never consulted.
inline bool conforms(const Element& e) {
    return e.exposed_constraints().has_value();
}

inline std::optional<TypeSet> constraints_of(const Element& e) {
    return e.exposed_constraints();
}

} // namespace constrained

#endif // CONSTRAINED_ELEMENT_HPP
