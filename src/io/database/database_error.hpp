// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef database_error_hpp
#define database_error_hpp

#include <string>

#include "exceptions/system_error.hpp"

namespace varcanon { namespace database {

/**
 Any failure reported by the database engine. These are fatal for the run.
 */
class DatabaseError : public SystemError
{
public:
    DatabaseError() = delete;
    
    DatabaseError(std::string where, std::string message, std::string sql = "");
    
    virtual ~DatabaseError() override = default;
    
    const std::string& sql() const noexcept;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string where_, message_, sql_;
};

} // namespace database
} // namespace varcanon

#endif
