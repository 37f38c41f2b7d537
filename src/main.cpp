// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <iostream>
#include <cstdlib>
#include <chrono>
#include <exception>
#include <new>

#include "config/config.hpp"
#include "config/common.hpp"
#include "logging/logging.hpp"
#include "logging/main_logging.hpp"
#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "core/commands/init_db.hpp"
#include "core/commands/sv_genotypes.hpp"
#include "utils/timing.hpp"
#include "exceptions/error.hpp"
#include "logging/error_handler.hpp"

using namespace varcanon;
using namespace varcanon::options;

namespace {

// Errors raised before logging is configured still go to the console
template <typename E>
int report(const E& error, const bool logging_ready)
{
    if (!logging_ready) {
        logging::init();
        log_program_startup();
    }
    log_error(error);
    log_program_end();
    return EXIT_FAILURE;
}

void configure_logging(const OptionMap& options)
{
    logging::init(get_debug_log_file_name(options), get_trace_log_file_name(options));
    DEBUG_MODE = is_debug_mode(options);
    TRACE_MODE = is_trace_mode(options);
}

void dispatch(const Command command, const OptionMap& options)
{
    switch (command) {
        case Command::init_db:
        {
            auto components = collate_init_db_components(options);
            run_init_db(components);
            break;
        }
        case Command::sv_genotypes:
            run_sv_genotypes(collate_sv_genotypes_components(options));
            break;
    }
}

int run(const OptionMap& options)
{
    configure_logging(options);
    log_program_startup();
    const auto command = get_command(options);
    logging::InfoLogger log {};
    stream(log) << "Running " << command << " with " << to_string(options, true, false);
    const auto start = std::chrono::system_clock::now();
    dispatch(command, options);
    stream(log) << "Finished " << command << " in " << utils::TimeInterval {start, std::chrono::system_clock::now()};
    log_program_end();
    return EXIT_SUCCESS;
}

} // namespace

int main(const int argc, const char** argv)
{
    bool logging_ready {false};
    try {
        const auto options = parse_options(argc, argv);
        if (!is_run_command(options)) return EXIT_SUCCESS;
        logging_ready = true;
        return run(options);
    } catch (const Error& e) {
        return report(e, logging_ready);
    } catch (const std::bad_alloc& e) {
        return report(e, logging_ready);
    } catch (const std::exception& e) {
        return report(e, logging_ready);
    } catch (...) {
        if (!logging_ready) logging::init();
        log_unknown_error();
        log_program_end();
        return EXIT_FAILURE;
    }
}
