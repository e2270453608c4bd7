#ifndef CONSTRAINED_LIST_HPP
#define CONSTRAINED_LIST_HPP

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <constrained/declaration.hpp>
#include <constrained/element.hpp>
#include <constrained/errors.hpp>
#include <constrained/marker.hpp>
#include <constrained/type_set.hpp>

namespace constrained {

namespace detail {

template <typename R> std::vector<Element> to_batch(const R& values) {
    std::vector<Element> batch;
    if constexpr (std::ranges::sized_range<const R>)
        batch.reserve(std::ranges::size(values));
    for (const auto& v : values)
        batch.emplace_back(v);
    return batch;
}

} // namespace detail

// Sequence of elements whose runtime types are restricted to an allowed set.
//
// Param and Declared form the class-level declaration (see
// declared_constraints): List<std::string> accepts strings,
// List<Placeholder, Constraints<int, double>> accepts ints and doubles, and
// List<> resolves its set from the first batch. An explicit TypeSet passed to
// a constructor overrides the class-level declaration for that instance.
//
// Storage is private and every mutating member checks its argument first, so
// types derived from List construct and mutate through the same checks. A
// rejected call throws a ConstraintViolation and changes nothing.
template <typename Param = Placeholder, typename Declared = Constraints<>,
          typename Storage = std::vector<Element>>
class List : public IsConstrained {
    static_assert(is_constraints_v<Declared>,
                  "derivation configuration must be Constraints<Ts...>");
    static_assert(std::is_same_v<typename Storage::value_type, Element>,
                  "storage must be a sequence of Element");

  public:
    using value_type = Element;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using const_reference = const Element&;
    using const_iterator = typename Storage::const_iterator;
    using iterator = const_iterator;
    using storage_type = Storage;

    // --- Class-level declaration ---

    static std::optional<TypeSet> declared() {
        return declared_constraints<Param, Declared>();
    }

    static bool is_open() { return !declared().has_value(); }

    // --- Construction ---

    List() : List(std::vector<Element>{}) {}

    List(std::initializer_list<Element> batch,
         std::optional<TypeSet> explicit_set = std::nullopt)
        : List(std::vector<Element>(batch), std::move(explicit_set)) {}

    explicit List(std::vector<Element> batch,
                  std::optional<TypeSet> explicit_set = std::nullopt)
        : allowed_(resolve_constraints(batch, explicit_set, declared())) {
        for (std::size_t i = 0; i < batch.size(); ++i)
            if (!allowed_.contains(batch[i].type()))
                throw ConstructionViolation(i, batch[i].type(), allowed_);
        items_.insert(items_.end(), std::make_move_iterator(batch.begin()),
                      std::make_move_iterator(batch.end()));
    }

    template <detail::batch_range R>
        requires(!std::is_same_v<std::remove_cvref_t<R>, std::vector<Element>>)
    explicit List(const R& batch,
                  std::optional<TypeSet> explicit_set = std::nullopt)
        : List(detail::to_batch(batch), std::move(explicit_set)) {}

    // --- Introspection ---

    const TypeSet& constraints() const override { return allowed_; }

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const Element& at(std::ptrdiff_t index) const {
        return items_[position(index, "at")];
    }

    const Element& front() const { return at(0); }
    const Element& back() const { return at(-1); }

    template <typename T> const T& get(std::ptrdiff_t index) const {
        return at(index).template get<T>();
    }

    template <typename T> const T* try_get(std::ptrdiff_t index) const {
        return at(index).template try_get<T>();
    }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    const Storage& elements() const { return items_; }

    bool contains(const Element& value) const {
        return std::find(items_.begin(), items_.end(), value) != items_.end();
    }

    std::size_t count(const Element& value) const {
        return static_cast<std::size_t>(
            std::count(items_.begin(), items_.end(), value));
    }

    // Position of the first element equal to `value`
    std::optional<std::size_t> index(const Element& value) const {
        auto it = std::find(items_.begin(), items_.end(), value);
        if (it == items_.end())
            return std::nullopt;
        return static_cast<std::size_t>(it - items_.begin());
    }

    List copy() const { return *this; }

    // --- Indexed access with checked assignment ---

    class Slot {
      public:
        using element_proxy = void;

        Slot& operator=(Element value) {
            owner_->set(index_, std::move(value));
            return *this;
        }

        Slot& operator=(const Slot& other) { return *this = other.get(); }

        const Element& get() const { return owner_->at(index_); }
        operator const Element&() const { return get(); }

      private:
        friend List;
        Slot(List* owner, std::ptrdiff_t index)
            : owner_(owner), index_(index) {}

        List* owner_;
        std::ptrdiff_t index_;
    };

    Slot operator[](std::ptrdiff_t index) { return Slot(this, index); }
    const Element& operator[](std::ptrdiff_t index) const { return at(index); }

    // --- Guarded mutation ---

    void append(Element value) {
        check(value, "append");
        items_.push_back(std::move(value));
    }

    void push_back(Element value) { append(std::move(value)); }

    // Negative indices count from the end; out-of-range indices clamp
    void insert(std::ptrdiff_t index, Element value) {
        check(value, "insert");
        auto pos = insertion_point(index);
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(pos),
                      std::move(value));
    }

    void set(std::ptrdiff_t index, Element value) {
        check(value, "set");
        items_[position(index, "set")] = std::move(value);
    }

    template <detail::batch_range R> void extend(const R& values) {
        commit(detail::to_batch(values), "extend");
    }

    void extend(std::initializer_list<Element> values) {
        commit(std::vector<Element>(values), "extend");
    }

    void extend(const Element& values) {
        commit(unpack(values, "extend"), "extend");
    }

    template <detail::batch_range R> List& operator+=(const R& values) {
        commit(detail::to_batch(values), "concatenate");
        return *this;
    }

    List& operator+=(std::initializer_list<Element> values) {
        commit(std::vector<Element>(values), "concatenate");
        return *this;
    }

    List& operator+=(const Element& values) {
        commit(unpack(values, "concatenate"), "concatenate");
        return *this;
    }

    // Repeats the contents n times in place; n <= 0 empties the list.
    // No new element types can appear, only the count is checked. A result
    // larger than the storage can hold throws std::length_error and leaves
    // the list unchanged.
    template <detail::repetition_count N> void repeat(N n) {
        repeat_by(detail::clamp_count(n));
    }

    void repeat(const Element& n) {
        auto times = n.repetition_count();
        if (!times)
            throw ArgumentShapeViolation("repeat", "integer repetition count",
                                         n.type());
        repeat_by(*times);
    }

    template <detail::repetition_count N> List& operator*=(N n) {
        repeat(n);
        return *this;
    }

    List& operator*=(const Element& n) {
        repeat(n);
        return *this;
    }

    // --- Removal (cannot introduce new types, no check needed) ---

    Element pop(std::ptrdiff_t index = -1) {
        auto pos = position(index, "pop");
        Element value = std::move(items_[pos]);
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(pos));
        return value;
    }

    void erase(std::ptrdiff_t index) {
        auto pos = position(index, "erase");
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(pos));
    }

    // Removes the first element equal to `value`; false if there was none
    bool remove(const Element& value) {
        auto it = std::find(items_.begin(), items_.end(), value);
        if (it == items_.end())
            return false;
        items_.erase(it);
        return true;
    }

    void clear() { items_.clear(); }
    void reverse() { std::reverse(items_.begin(), items_.end()); }

    // --- Non-mutating concatenation and repetition ---

    // The result keeps the left operand's allowed set
    template <typename R> friend List operator+(const List& a, const R& b) {
        List result = a;
        result += b;
        return result;
    }

    friend List operator+(const List& a, std::initializer_list<Element> b) {
        List result = a;
        result += b;
        return result;
    }

    template <detail::repetition_count N>
    friend List operator*(const List& a, N n) {
        List result = a;
        result.repeat(n);
        return result;
    }

    // Sequence equality: same elements in the same order
    friend bool operator==(const List& a, const List& b) {
        return a.items_ == b.items_;
    }

  private:
    void check(const Element& value, const char* operation) const {
        if (!allowed_.contains(value.type()))
            throw ElementTypeViolation(operation, value.type(), allowed_);
    }

    // Whole batch is checked before anything is stored
    void commit(std::vector<Element> batch, const char* operation) {
        for (std::size_t i = 0; i < batch.size(); ++i)
            if (!allowed_.contains(batch[i].type()))
                throw BatchTypeViolation(operation, i, batch[i].type(),
                                         allowed_);
        items_.insert(items_.end(), std::make_move_iterator(batch.begin()),
                      std::make_move_iterator(batch.end()));
    }

    std::vector<Element> unpack(const Element& values,
                                const char* operation) const {
        auto batch = values.unpack();
        if (!batch)
            throw ArgumentShapeViolation(operation, "sequence of elements",
                                         values.type());
        return std::move(*batch);
    }

    void repeat_by(std::ptrdiff_t n) {
        if (n <= 0) {
            items_.clear();
            return;
        }
        if (items_.empty() || n == 1)
            return;
        auto times = static_cast<std::size_t>(n);
        if (items_.size() > items_.max_size() / times)
            throw std::length_error("repeat: result exceeds maximum list size");
        Storage grown;
        if constexpr (requires { grown.reserve(std::size_t{}); })
            grown.reserve(items_.size() * times);
        for (std::ptrdiff_t i = 0; i < n; ++i)
            grown.insert(grown.end(), items_.begin(), items_.end());
        items_.swap(grown);
    }

    std::size_t position(std::ptrdiff_t index, const char* operation) const {
        auto n = static_cast<std::ptrdiff_t>(items_.size());
        if (index < 0)
            index += n;
        if (index < 0 || index >= n)
            throw std::out_of_range(std::string(operation) +
                                    ": index out of range");
        return static_cast<std::size_t>(index);
    }

    std::size_t insertion_point(std::ptrdiff_t index) const {
        auto n = static_cast<std::ptrdiff_t>(items_.size());
        if (index < 0)
            index = std::max<std::ptrdiff_t>(index + n, 0);
        return static_cast<std::size_t>(std::min(index, n));
    }

    TypeSet allowed_;
    Storage items_;
};

// --- Common derivations ---

// Allowed set resolved per instance
using Vec = List<>;

// Allowed set fixed by the type
template <typename... Ts> using Array = List<Placeholder, Constraints<Ts...>>;

} // namespace constrained

#endif // CONSTRAINED_LIST_HPP
