// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include "logging.hpp"

namespace varcanon {

// Both write framed banners to the info log
void log_program_startup();
void log_program_end();

} // namespace varcanon

#endif
