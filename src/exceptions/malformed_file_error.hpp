// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef malformed_file_error_hpp
#define malformed_file_error_hpp

#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace varcanon {

// The file exists but its contents cannot be used as the given kind of file
class MalformedFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MalformedFileError() = delete;
    
    MalformedFileError(Path file, std::string kind);
    MalformedFileError(Path file, std::string kind, std::string reason);
    
    const Path& file() const noexcept;
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::string kind_;
    boost::optional<std::string> reason_;
};

} // namespace varcanon

#endif
