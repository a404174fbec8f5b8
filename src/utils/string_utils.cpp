// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <array>
#include <cctype>
#include <utility>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace polyscan { namespace utils {

std::vector<std::string> split(const std::string& str, const char delim) {
    std::vector<std::string> elems;
    elems.reserve(std::count(std::cbegin(str), std::cend(str), delim) + 1);
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        elems.push_back(item);
    }
    return elems;
}

std::string join(const std::vector<std::string>& strings, const std::string delim)
{
    return boost::algorithm::join(strings, delim);
}

std::string join(const std::vector<std::string>& strings, const char delim)
{
    const std::array<char, 2> Delim {delim, '\0'};
    return join(strings, Delim.data());
}

std::vector<std::string> wrap(const std::string& text, const std::size_t width)
{
    std::vector<std::string> result {};
    std::string line {};
    for (auto& word : split(text, ' ')) {
        if (word.empty()) continue;
        if (!line.empty() && line.size() + word.size() + 1 > width) {
            result.push_back(std::move(line));
            line.clear();
        }
        if (!line.empty()) line += ' ';
        line += word;
    }
    if (!line.empty()) result.push_back(std::move(line));
    return result;
}

std::string& capitalise(std::string& str) noexcept
{
    std::transform(std::cbegin(str), std::cend(str), std::begin(str),
                   [] (unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string capitalise(const std::string& str)
{
    auto result = str;
    return capitalise(result);
}

std::string& capitalise_front(std::string& str) noexcept
{
    if (!str.empty()) str.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(str.front())));
    return str;
}

std::string capitalise_front(const std::string& str)
{
    auto result = str;
    return capitalise_front(result);
}

std::string& strip_whitespace(std::string& str)
{
    str.erase(std::remove_if(std::begin(str), std::end(str),
                             [] (unsigned char c) { return std::isspace(c); }),
              std::end(str));
    return str;
}

std::string& trim(std::string& str)
{
    boost::algorithm::trim(str);
    return str;
}

} // namespace utils
} // namespace polyscan
