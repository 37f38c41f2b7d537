// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef error_hpp
#define error_hpp

#include <exception>
#include <string>

namespace varcanon {

/**
 Base of all deliberate varcanon exceptions. The four parts are logged
 separately by the top level error handler: who is at fault (type), a coarse
 location (where), the cause (why) and a suggested fix (help).
 */
class Error : public std::exception
{
public:
    ~Error() override = default;
    
    std::string type() const;
    std::string where() const;
    std::string why() const;
    std::string help() const;
    
    // "<type> error in <where>: <why>"
    const char* what() const noexcept override;
    
private:
    virtual std::string do_type() const  = 0;
    virtual std::string do_where() const = 0;
    virtual std::string do_why() const   = 0;
    virtual std::string do_help() const  = 0;
    
    mutable std::string what_;
};

} // namespace varcanon

#endif
