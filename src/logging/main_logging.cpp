// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include <string>

#include "config/config.hpp"

namespace varcanon {

namespace {

void log_rule(logging::InfoLogger& log)
{
    log << std::string(config::CommandLineWidth, '-');
}

} // namespace

void log_program_startup()
{
    logging::InfoLogger log {};
    log_rule(log);
    stream(log) << "varcanon v" << config::Version;
    log << config::CopyrightNotice;
    log_rule(log);
}

void log_program_end()
{
    logging::InfoLogger log {};
    log_rule(log);
}

} // namespace varcanon
