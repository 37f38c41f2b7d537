// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef common_hpp
#define common_hpp

#include <string>

#include <boost/optional.hpp>

#include "logging/logging.hpp"

namespace varcanon {

extern bool DEBUG_MODE;
extern bool TRACE_MODE;

using SampleName  = std::string;
using ContigName  = std::string;
using ReleaseName = std::string;

namespace logging {
    boost::optional<DebugLogger> get_debug_log();
    boost::optional<TraceLogger> get_trace_log();
}

} // namespace varcanon

#endif
