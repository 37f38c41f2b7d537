// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef system_error_hpp
#define system_error_hpp

#include <string>

#include "error.hpp"

namespace varcanon {

// Raised by the environment: memory, permissions, disk
class SystemError : public Error
{
    std::string do_type() const override { return "system"; }
};

} // namespace varcanon

#endif
