// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "path_utils.hpp"

#include <string>
#include <cstdlib>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "exceptions/system_error.hpp"

namespace varcanon {

namespace {

class UnknownHomeDirectory : public SystemError
{
public:
    UnknownHomeDirectory(fs::path path) : path_ {std::move(path)} {}
    
private:
    fs::path path_;
    
    std::string do_where() const override { return "expand_user_path"; }
    std::string do_why() const override
    {
        return "the path " + path_.string() + " starts with ~ but there is no usable HOME directory";
    }
    std::string do_help() const override { return "set HOME or give the path in full"; }
};

} // namespace

fs::path expand_user_path(const fs::path& path)
{
    const auto& str = path.string();
    if (!boost::starts_with(str, "~/")) return path;
    const char* home {std::getenv("HOME")};
    if (home == nullptr || !fs::is_directory(home)) throw UnknownHomeDirectory {path};
    return fs::path {home} / str.substr(2);
}

fs::path resolve_path(const fs::path& path, const fs::path& working_directory)
{
    const auto expanded = expand_user_path(path);
    return expanded.is_absolute() ? expanded : fs::absolute(expanded, working_directory);
}

} // namespace varcanon
