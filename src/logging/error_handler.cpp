// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error_handler.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cctype>

#include "exceptions/system_error.hpp"
#include "config/config.hpp"
#include "config/common.hpp"
#include "utils/string_utils.hpp"
#include "logging.hpp"

namespace varcanon {

namespace {

// Greedy word wrap of a sentence that always ends with a full stop
std::vector<std::string> wrap_sentence(std::string text, const std::size_t width, const std::string& indent = "")
{
    std::vector<std::string> result {};
    if (text.empty()) return result;
    utils::capitalise_front(text);
    if (text.back() != '.') text += '.';
    std::string line {indent};
    for (const auto& word : utils::split(text, ' ')) {
        if (word.empty()) continue;
        if (line.size() > indent.size() && line.size() + 1 + word.size() > width) {
            result.push_back(line);
            line = indent;
        }
        if (line.size() > indent.size()) line += ' ';
        line += word;
    }
    if (line.size() > indent.size()) result.push_back(line);
    return result;
}

std::string make_headline(const Error& error)
{
    const auto type = error.type();
    return (type == "unclassified" ? "An " : "A ") + type + " error has occurred:";
}

std::string make_help_sentence(const Error& error)
{
    auto help = error.help();
    if (!help.empty()) help.front() = static_cast<char>(std::tolower(help.front()));
    return "To help resolve this error " + help;
}

class OutOfMemory : public SystemError
{
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return "system could not satisfy memory request"; }
    std::string do_help() const override
    {
        return "ensure the system has sufficient resources or submit an error report";
    }
};

class UnclassifiedError : public Error
{
public:
    UnclassifiedError(std::string why) : why_ {std::move(why)} {}
    
private:
    std::string why_;
    
    std::string do_type() const override { return "unclassified"; }
    std::string do_where() const override { return "unknown"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override { return "submit an error report to " + config::BugReport; }
};

} // namespace

void log_error(const Error& error)
{
    logging::ErrorLogger log {};
    log << make_headline(error);
    log_empty_line(log);
    for (const auto& line : wrap_sentence(error.why(), config::CommandLineWidth, "    ")) log << line;
    log_empty_line(log);
    for (const auto& line : wrap_sentence(make_help_sentence(error), config::CommandLineWidth)) log << line;
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << "Error raised in " << error.where();
    }
}

void log_error(const std::bad_alloc&)
{
    log_error(OutOfMemory {});
}

void log_error(const std::exception& error)
{
    log_error(UnclassifiedError {error.what()});
}

void log_unknown_error()
{
    log_error(UnclassifiedError {"unknown"});
}

} // namespace varcanon
