// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef program_error_hpp
#define program_error_hpp

#include <string>

#include "error.hpp"
#include "config/config.hpp"

namespace varcanon {

// A bug in varcanon rather than a problem with the input
class ProgramError : public Error
{
    std::string do_type() const override { return "program"; }
    std::string do_help() const override
    {
        return "rerun with --debug and report the issue with the log attached at " + config::BugReport;
    }
};

} // namespace varcanon

#endif
