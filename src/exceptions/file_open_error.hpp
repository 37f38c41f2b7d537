// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef file_open_error_hpp
#define file_open_error_hpp

#include <string>
#include <system_error>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "system_error.hpp"

namespace varcanon {

// The file exists but the operating system or htslib refused to open it
class FileOpenError : public SystemError
{
public:
    using Path = boost::filesystem::path;
    
    FileOpenError() = delete;
    
    FileOpenError(Path file, std::string kind);
    FileOpenError(Path file, std::string kind, std::error_code error);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::string kind_;
    boost::optional<std::error_code> error_;
};

} // namespace varcanon

#endif
