// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef captured_log_hpp
#define captured_log_hpp

#include <sstream>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

#include "logging/logging.hpp"

namespace varcanon { namespace test { namespace mock {

// Collects every record at or above a severity while in scope
class CapturedLog
{
public:
    explicit CapturedLog(logging::severity_level min_level = logging::severity_level::warning);
    
    CapturedLog(const CapturedLog&)            = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;
    
    ~CapturedLog();
    
    std::string text() const;
    bool contains(const std::string& message) const;
    
private:
    using Sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    
    boost::shared_ptr<std::ostringstream> buffer_;
    boost::shared_ptr<Sink> sink_;
};

} // namespace mock
} // namespace test
} // namespace varcanon

#endif
