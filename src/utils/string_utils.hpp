// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <string>
#include <cstddef>

namespace varcanon { namespace utils {

// Empty fields are kept, so n delimiters always give n + 1 fields
std::vector<std::string> split(const std::string& str, char delim);
std::vector<std::string> split(const std::string& str, const std::string& delims); // any of delims

std::string join(const std::vector<std::string>& strings, const std::string& delim = "");
std::string join(const std::vector<std::string>& strings, char delim);

bool is_prefix(const std::string& prefix, const std::string& text) noexcept;

std::string& capitalise_front(std::string& str) noexcept;
std::string capitalise_front(const std::string& str);

// Removes every c
std::string& strip(std::string& str, char c);

// 1234567 -> "1,234,567"
std::string format_with_commas(std::size_t value);

} // namespace utils
} // namespace varcanon

#endif
