#ifndef CONSTRAINED_PRETTY_HPP
#define CONSTRAINED_PRETTY_HPP

#include <algorithm>
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#include <constrained/type_set.hpp>

namespace constrained {

namespace detail {

inline const std::map<std::type_index, std::string>& known_type_names() {
    static const std::map<std::type_index, std::string> names{
        {typeid(bool), "bool"},
        {typeid(char), "char"},
        {typeid(signed char), "signed char"},
        {typeid(unsigned char), "unsigned char"},
        {typeid(short), "short"},
        {typeid(unsigned short), "unsigned short"},
        {typeid(int), "int"},
        {typeid(unsigned int), "unsigned int"},
        {typeid(long), "long"},
        {typeid(unsigned long), "unsigned long"},
        {typeid(long long), "long long"},
        {typeid(unsigned long long), "unsigned long long"},
        {typeid(float), "float"},
        {typeid(double), "double"},
        {typeid(long double), "long double"},
        {typeid(std::nullptr_t), "std::nullptr_t"},
        {typeid(std::string), "std::string"},
        {typeid(std::wstring), "std::wstring"},
        {typeid(std::string_view), "std::string_view"},
    };
    return names;
}

} // namespace detail

// Readable name for fundamental and string types; the implementation's
// type_info name otherwise.
inline std::string type_name(std::type_index id) {
    const auto& names = detail::known_type_names();
    auto it = names.find(id);
    if (it != names.end())
        return it->second;
    return id.name();
}

// "{double, int, std::string}" -- names sorted so output is stable
inline std::string to_string(const TypeSet& set) {
    std::vector<std::string> names;
    names.reserve(set.size());
    for (const auto& id : set)
        names.push_back(type_name(id));
    std::sort(names.begin(), names.end());

    std::string s = "{";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0)
            s += ", ";
        s += names[i];
    }
    s += '}';
    return s;
}

inline std::ostream& operator<<(std::ostream& os, const TypeSet& set) {
    return os << to_string(set);
}

} // namespace constrained

#endif // CONSTRAINED_PRETTY_HPP
