// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace varcanon { namespace utils {

std::vector<std::string> split(const std::string& str, const char delim)
{
    std::vector<std::string> result {};
    boost::split(result, str, [delim] (const char c) { return c == delim; });
    return result;
}

std::vector<std::string> split(const std::string& str, const std::string& delims)
{
    std::vector<std::string> result {};
    boost::split(result, str, boost::is_any_of(delims));
    return result;
}

std::string join(const std::vector<std::string>& strings, const std::string& delim)
{
    return boost::algorithm::join(strings, delim);
}

std::string join(const std::vector<std::string>& strings, const char delim)
{
    return boost::algorithm::join(strings, std::string(1, delim));
}

bool is_prefix(const std::string& prefix, const std::string& text) noexcept
{
    return boost::algorithm::starts_with(text, prefix);
}

std::string& capitalise_front(std::string& str) noexcept
{
    if (!str.empty()) str.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(str.front())));
    return str;
}

std::string capitalise_front(const std::string& str)
{
    auto result = str;
    capitalise_front(result);
    return result;
}

std::string& strip(std::string& str, const char c)
{
    str.erase(std::remove(std::begin(str), std::end(str), c), std::end(str));
    return str;
}

std::string format_with_commas(const std::size_t value)
{
    const auto digits = std::to_string(value);
    std::string result {};
    result.reserve(digits.size() + digits.size() / 3);
    for (std::size_t i {0}; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) result += ',';
        result += digits[i];
    }
    return result;
}

} // namespace utils
} // namespace varcanon
