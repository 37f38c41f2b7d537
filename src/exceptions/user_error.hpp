// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef user_error_hpp
#define user_error_hpp

#include <string>

#include "error.hpp"

namespace varcanon {

// Bad input files or option values
class UserError : public Error
{
    std::string do_type() const override { return "user"; }
};

} // namespace varcanon

#endif
