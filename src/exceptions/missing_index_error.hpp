// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_index_error_hpp
#define missing_index_error_hpp

#include <string>

#include <boost/filesystem/path.hpp>

#include "user_error.hpp"

namespace varcanon {

// Random access was needed but the file has no index beside it
class MissingIndexError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MissingIndexError() = delete;
    
    MissingIndexError(Path indexed_file, std::string kind);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path indexed_file_;
    std::string kind_;
};

} // namespace varcanon

#endif
