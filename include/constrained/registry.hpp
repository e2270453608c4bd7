#ifndef CONSTRAINED_REGISTRY_HPP
#define CONSTRAINED_REGISTRY_HPP

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <typeindex>

#include <constrained/element.hpp>
#include <constrained/marker.hpp>
#include <constrained/type_set.hpp>

namespace constrained {

// Table of foreign sequence types accepted as compatible containers without
// exposing an allowed-type set. Nothing is registered implicitly.
class Registry {
  public:
    template <typename T> Registry& add() {
        return add(detail::type_id<T>());
    }

    Registry& add(std::type_index id) {
        entries_.insert(id);
        return *this;
    }

    // Returns false if the type was not registered
    template <typename T> bool remove() { return remove(detail::type_id<T>()); }

    bool remove(std::type_index id) { return entries_.erase(id) != 0; }

    template <typename T> bool contains() const {
        return contains(detail::type_id<T>());
    }

    bool contains(std::type_index id) const {
        return entries_.count(id) != 0;
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::set<std::type_index>& entries() const { return entries_; }

    // Starter table of the standard library's string sequences. Typed
    // arrays are class templates (std::array<T, N>, std::vector<T>) with no
    // single type_index to register, so they are left to callers; types
    // deriving from IsConstrained already conform structurally.
    static Registry sequences() {
        Registry r;
        r.add<std::string>().add<std::wstring>().add<std::string_view>();
        return r;
    }

  private:
    std::set<std::type_index> entries_;
};

// Process-wide registry, empty until populated. Not synchronized.
inline Registry& default_registry() {
    static Registry registry;
    return registry;
}

// --- Broader compatibility contract: structural OR registered ---

template <typename T>
bool is_compatible(const Registry& registry = default_registry()) {
    return conforms<T>() || registry.contains<T>();
}

inline bool is_compatible(const Element& e,
                          const Registry& registry = default_registry()) {
    return conforms(e) || registry.contains(e.type());
}

} // namespace constrained

#endif // CONSTRAINED_REGISTRY_HPP
