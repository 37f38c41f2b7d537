// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_file_error_hpp
#define missing_file_error_hpp

#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace varcanon {

// An input path that does not exist
class MissingFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MissingFileError() = delete;
    
    MissingFileError(Path file, std::string kind);
    
    const Path& file() const noexcept;
    
    // Names the option or setting the path came from
    void set_source(std::string source);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::string kind_;
    boost::optional<std::string> source_;
};

} // namespace varcanon

#endif
