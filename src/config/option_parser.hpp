// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_parser_hpp
#define option_parser_hpp

#include <string>
#include <iosfwd>

#include <boost/program_options.hpp>
#include <boost/filesystem/path.hpp>

namespace varcanon { namespace options {

using OptionMap = boost::program_options::variables_map;

OptionMap parse_options(int argc, const char** argv);

boost::filesystem::path get_working_directory(const OptionMap& options);
boost::filesystem::path resolve_path(const boost::filesystem::path& path, const OptionMap& options);

enum class Command { init_db, sv_genotypes };

struct CoveragePath
{
    std::string sample;
    boost::filesystem::path path;
};

std::istream& operator>>(std::istream& in, Command& command);
std::ostream& operator<<(std::ostream& os, const Command& command);
std::istream& operator>>(std::istream& in, CoveragePath& coverage);
std::ostream& operator<<(std::ostream& os, const CoveragePath& coverage);

std::ostream& operator<<(std::ostream& os, const OptionMap& options);
std::string to_string(const OptionMap& options, bool one_line = false, bool mark_modified = true);

} // namespace options
} // namespace varcanon

#endif
