#ifndef CONSTRAINED_TYPE_SET_HPP
#define CONSTRAINED_TYPE_SET_HPP

#include <cstddef>
#include <initializer_list>
#include <set>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace constrained {

namespace detail {

// Type an element is stored as. Character strings (arrays and pointers) are
// kept as std::string so that "a" and std::string("a") share one type.
template <typename T> struct stored {
    using type = std::remove_cvref_t<T>;
};

template <typename T>
    requires(std::is_same_v<std::decay_t<T>, const char*> ||
             std::is_same_v<std::decay_t<T>, char*>)
struct stored<T> {
    using type = std::string;
};

template <typename T> using stored_t = typename stored<T>::type;

template <typename T> std::type_index type_id() {
    return std::type_index(typeid(stored_t<T>));
}

} // namespace detail

// The set of runtime types a container accepts. Order-irrelevant, value
// semantics: with() returns a new set, the original is never changed.
class TypeSet {
  public:
    using const_iterator = std::set<std::type_index>::const_iterator;

    TypeSet() = default;
    TypeSet(std::initializer_list<std::type_index> ids) : ids_(ids) {}

    template <typename... Ts> static TypeSet of() {
        TypeSet result;
        (result.ids_.insert(detail::type_id<Ts>()), ...);
        return result;
    }

    template <typename T> TypeSet with() const {
        return with(detail::type_id<T>());
    }

    TypeSet with(std::type_index id) const {
        TypeSet result = *this;
        result.ids_.insert(id);
        return result;
    }

    // Union
    TypeSet with(const TypeSet& other) const {
        TypeSet result = *this;
        result.ids_.insert(other.ids_.begin(), other.ids_.end());
        return result;
    }

    template <typename T> bool contains() const {
        return contains(detail::type_id<T>());
    }

    bool contains(std::type_index id) const { return ids_.count(id) != 0; }

    // True if every type of `other` is also in this set
    bool includes(const TypeSet& other) const {
        for (const auto& id : other.ids_)
            if (!contains(id))
                return false;
        return true;
    }

    std::size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    const_iterator begin() const { return ids_.begin(); }
    const_iterator end() const { return ids_.end(); }

    friend bool operator==(const TypeSet& a, const TypeSet& b) {
        return a.ids_ == b.ids_;
    }

  private:
    std::set<std::type_index> ids_;
};

} // namespace constrained

#endif // CONSTRAINED_TYPE_SET_HPP
