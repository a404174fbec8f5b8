// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <cstddef>
#include <string>
#include <type_traits>
#include <sstream>
#include <iomanip>

namespace polyscan { namespace utils {

std::vector<std::string> split(const std::string& str, const char delim);

std::string join(const std::vector<std::string>& strings, const std::string delim = "");
std::string join(const std::vector<std::string>& strings, const char delim);

// Greedy word wrap on spaces. A word longer than width gets a line of its own.
std::vector<std::string> wrap(const std::string& text, std::size_t width);

std::string& capitalise(std::string& str) noexcept;
std::string capitalise(const std::string& str);
std::string& capitalise_front(std::string& str) noexcept;
std::string capitalise_front(const std::string& str);

std::string& strip_whitespace(std::string& str);
std::string& trim(std::string& str);

template <typename T, typename = typename std::enable_if_t<std::is_floating_point<T>::value>>
std::string to_string(const T val, const unsigned precision = 2)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << val;
    return out.str();
}

} // namespace utils
} // namespace polyscan

#endif
