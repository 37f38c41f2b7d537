// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_parser.hpp"

#include <vector>
#include <iostream>
#include <sstream>
#include <fstream>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/version.hpp>

#include "utils/path_utils.hpp"
#include "utils/string_utils.hpp"
#include "exceptions/user_error.hpp"
#include "config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace varcanon { namespace options {

namespace {

class CommandLineError : public UserError
{
public:
    CommandLineError(std::string why) : why_ {std::move(why)} {}
    
private:
    std::string why_;
    
    std::string do_where() const override { return "parse_options"; }
    std::string do_why() const override { return why_; }
    std::string do_help() const override
    {
        return "use the --help command to view required and allowable options";
    }
};

class InvalidWorkingDirectory : public UserError
{
public:
    InvalidWorkingDirectory(fs::path directory) : directory_ {std::move(directory)} {}
    
private:
    fs::path directory_;
    
    std::string do_where() const override { return "get_working_directory"; }
    std::string do_why() const override
    {
        return "the working directory " + directory_.string() + " does not exist";
    }
    std::string do_help() const override { return "give an existing directory to --working-directory"; }
};

// Rethrows boost::program_options errors as CommandLineError
template <typename F>
auto translate_errors(F&& f)
{
    try {
        return f();
    } catch (const po::required_option& e) {
        throw CommandLineError {"the option '--" + po::strip_prefixes(e.get_option_name()) + "' is required but is missing"};
    } catch (const po::unknown_option& e) {
        throw CommandLineError {"the option '--" + po::strip_prefixes(e.get_option_name()) + "' is not recognised"};
    } catch (const po::error& e) {
        throw CommandLineError {e.what()};
    }
}

po::parsed_options parse_command_line(int argc, const char** argv, const po::options_description& options,
                                      const po::positional_options_description& positional,
                                      const bool allow_unregistered = false)
{
    return translate_errors([&] () {
        po::command_line_parser parser {argc, argv};
        parser.options(options).positional(positional);
        if (allow_unregistered) parser.allow_unregistered();
        return parser.run();
    });
}

void store_config_file(const fs::path& config_file, const po::options_description& options, OptionMap& vm)
{
    if (!fs::exists(config_file)) {
        throw CommandLineError {"the config file " + config_file.string() + " given to '--config' does not exist"};
    }
    std::ifstream config {config_file.string()};
    if (!config) {
        throw CommandLineError {"the config file " + config_file.string() + " could not be read"};
    }
    translate_errors([&] () { po::store(po::parse_config_file(config, options), vm); return 0; });
}

void require(const OptionMap& vm, const Command command, const std::string& option)
{
    if (vm.count(option) == 0) {
        std::ostringstream ss {};
        ss << "the " << command << " command requires the option '--" << option << "'";
        throw CommandLineError {ss.str()};
    }
}

void forbid(const OptionMap& vm, const Command command, const std::vector<std::string>& options)
{
    for (const auto& option : options) {
        if (vm.count(option) == 1 && !vm.at(option).defaulted()) {
            std::ostringstream ss {};
            ss << "the option '--" << option << "' cannot be used with the " << command << " command";
            throw CommandLineError {ss.str()};
        }
    }
}

void require_positive(const OptionMap& vm, const std::string& option)
{
    if (vm.count(option) == 1 && vm.at(option).as<int>() <= 0) {
        throw CommandLineError {"the value given to '--" + option + "' must be greater than zero"};
    }
}

void validate(const OptionMap& vm)
{
    if (vm.count("command") == 0) {
        throw CommandLineError {"no command was given; the first argument must be 'init-db' or 'sv-genotypes'"};
    }
    const auto command = vm.at("command").as<Command>();
    switch (command) {
        case Command::init_db:
            require(vm, command, "db-path");
            require(vm, command, "ref-path");
            forbid(vm, command, {"sv-path", "coverage-path", "output"});
            require_positive(vm, "max-allele-length");
            break;
        case Command::sv_genotypes:
            require(vm, command, "sv-path");
            require(vm, command, "output");
            forbid(vm, command, {"db-path", "ref-path", "release", "exac-path", "gnomad-exomes-path",
                                 "gnomad-genomes-path", "thousand-genomes-path", "clinvar-path", "region",
                                 "max-allele-length"});
            break;
    }
}

void print_help(const OptionMap& vm, const po::options_description& general,
                const po::options_description& init_db, const po::options_description& sv_genotypes)
{
    std::cout << "Usage: varcanon <init-db|sv-genotypes> [options]\n" << std::endl;
    po::options_description shown {"varcanon command line options"};
    shown.add(general);
    if (vm.count("command") == 0 || vm.at("command").as<Command>() == Command::init_db) shown.add(init_db);
    if (vm.count("command") == 0 || vm.at("command").as<Command>() == Command::sv_genotypes) shown.add(sv_genotypes);
    std::cout << shown << std::endl;
}

void print_version()
{
    std::cout << "varcanon version " << config::Version << '\n'
              << "Boost: " << BOOST_VERSION / 100000 << '.' << BOOST_VERSION / 100 % 1000 << '.'
              << BOOST_VERSION % 100 << std::endl;
}

} // namespace

OptionMap parse_options(const int argc, const char** argv)
{
    po::positional_options_description positional {};
    positional.add("command", 1);
    
    po::options_description hidden("Hidden");
    hidden.add_options()
    ("command",
     po::value<Command>(),
     "The command to run (init-db or sv-genotypes)")
    ;
    
    po::options_description general("General");
    general.add_options()
    ("help,h",
     "Report detailed option information")
    
    ("version",
     "Report detailed version information")
    
    ("config",
     po::value<fs::path>(),
     "Config file to populate command line options")
    
    ("debug",
     po::value<fs::path>()->implicit_value("varcanon_debug.log"),
     "Create log file for debugging")
    
    ("trace",
     po::value<fs::path>()->implicit_value("varcanon_trace.log"),
     "Create very verbose log file for debugging")
    
    ("working-directory,w",
     po::value<fs::path>(),
     "Sets the working directory")
    ;
    
    po::options_description init_db("init-db");
    init_db.add_options()
    ("db-path",
     po::value<fs::path>(),
     "SQLite database file to create or update")
    
    ("ref-path,R",
     po::value<fs::path>(),
     "Indexed FASTA reference genome used for variant normalisation")
    
    ("release",
     po::value<std::string>()->default_value(config::DefaultRelease),
     "Genome release written to every imported row")
    
    ("exac-path",
     po::value<fs::path>(),
     "ExAC sites VCF to import")
    
    ("gnomad-exomes-path",
     po::value<fs::path>(),
     "gnomAD exomes sites VCF to import")
    
    ("gnomad-genomes-path",
     po::value<fs::path>(),
     "gnomAD genomes sites VCF to import")
    
    ("thousand-genomes-path",
     po::value<std::vector<fs::path>>()->multitoken(),
     "1000 Genomes sites VCFs to import, e.g. one per chromosome")
    
    ("clinvar-path",
     po::value<std::vector<fs::path>>()->multitoken(),
     "ClinVar TSV files (MacArthur format) to import")
    
    ("region,T",
     po::value<std::string>(),
     "Only import VCF records overlapping this region (chrom[:begin[-end]])")
    
    ("max-allele-length",
     po::value<int>()->default_value(config::DefaultMaxAlleleLength),
     "Alleles longer than this are not imported")
    ;
    
    po::options_description sv_genotypes("sv-genotypes");
    sv_genotypes.add_options()
    ("sv-path",
     po::value<fs::path>(),
     "Structural variant VCF written by a supported caller")
    
    ("coverage-path",
     po::value<std::vector<CoveragePath>>()->multitoken(),
     "Maelstrom coverage VCFs given as SAMPLE=FILE")
    
    ("output,o",
     po::value<fs::path>(),
     "Tab separated file to write sample genotypes to")
    ;
    
    po::options_description all("varcanon command line options");
    all.add(hidden).add(general).add(init_db).add(sv_genotypes);
    
    OptionMap first_pass;
    po::store(parse_command_line(argc, argv, all, positional, true), first_pass);
    if (first_pass.count("help") == 1) {
        print_help(first_pass, general, init_db, sv_genotypes);
        return first_pass;
    }
    if (first_pass.count("version") == 1) {
        print_version();
        return first_pass;
    }
    OptionMap result;
    // Command line values take precedence over the config file
    po::store(parse_command_line(argc, argv, all, positional), result);
    if (first_pass.count("config") == 1) {
        store_config_file(resolve_path(first_pass.at("config").as<fs::path>(), first_pass), all, result);
    }
    validate(result);
    translate_errors([&] () { po::notify(result); return 0; });
    return result;
}

fs::path get_working_directory(const OptionMap& options)
{
    if (options.count("working-directory") == 0) return fs::current_path();
    auto result = expand_user_path(options.at("working-directory").as<fs::path>());
    if (!fs::is_directory(result)) {
        throw InvalidWorkingDirectory {result};
    }
    return result;
}

fs::path resolve_path(const fs::path& path, const OptionMap& options)
{
    return ::varcanon::resolve_path(path, get_working_directory(options));
}

std::istream& operator>>(std::istream& in, Command& command)
{
    std::string token;
    in >> token;
    if (token == "init-db") {
        command = Command::init_db;
    } else if (token == "sv-genotypes") {
        command = Command::sv_genotypes;
    } else {
        throw po::validation_error {po::validation_error::kind_t::invalid_option_value, "command", token};
    }
    return in;
}

std::ostream& operator<<(std::ostream& out, const Command& command)
{
    switch (command) {
        case Command::init_db: return out << "init-db";
        case Command::sv_genotypes: return out << "sv-genotypes";
    }
    return out;
}

std::istream& operator>>(std::istream& in, CoveragePath& coverage)
{
    std::string token;
    in >> token;
    const auto pos = token.find('=');
    if (pos == std::string::npos || pos == 0 || pos + 1 == token.size()) {
        throw po::validation_error {po::validation_error::kind_t::invalid_option_value, "coverage-path", token};
    }
    coverage.sample = token.substr(0, pos);
    coverage.path = token.substr(pos + 1);
    return in;
}

std::ostream& operator<<(std::ostream& out, const CoveragePath& coverage)
{
    return out << coverage.sample << '=' << coverage.path.filename().string();
}

namespace {

template <typename T>
bool holds(const po::variable_value& value)
{
    return boost::any_cast<T>(&value.value()) != nullptr;
}

std::string to_string(const fs::path& path)
{
    return path.filename().string();
}

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream ss {};
    ss << value;
    return ss.str();
}

template <typename T>
std::vector<std::string> render_list(const po::variable_value& value)
{
    std::vector<std::string> result {};
    for (const auto& element : value.as<std::vector<T>>()) result.push_back(to_string(element));
    return result;
}

// Values of list options are returned one per element
std::vector<std::string> render(const po::variable_value& value)
{
    if (value.empty()) return {"(empty)"};
    if (holds<int>(value)) return {std::to_string(value.as<int>())};
    if (holds<std::string>(value)) {
        const auto& str = value.as<std::string>();
        return {str.empty() ? "true" : str};
    }
    if (holds<fs::path>(value)) return {to_string(value.as<fs::path>())};
    if (holds<Command>(value)) return {to_string(value.as<Command>())};
    if (holds<std::vector<std::string>>(value)) return render_list<std::string>(value);
    if (holds<std::vector<fs::path>>(value)) return render_list<fs::path>(value);
    if (holds<std::vector<CoveragePath>>(value)) return render_list<CoveragePath>(value);
    return {std::string {"UnknownType("} + value.value().type().name() + ")"};
}

} // namespace

std::ostream& operator<<(std::ostream& os, const OptionMap& options)
{
    std::vector<std::string> lines {};
    for (const auto& p : options) {
        const char bullet {p.second.defaulted() ? '>' : '~'};
        const auto values = render(p.second);
        const bool is_list {!p.second.empty() && (holds<std::vector<std::string>>(p.second)
                            || holds<std::vector<fs::path>>(p.second) || holds<std::vector<CoveragePath>>(p.second))};
        for (std::size_t i {0}; i < values.size(); ++i) {
            std::ostringstream line {};
            line << bullet << ' ' << p.first;
            if (is_list) line << '[' << i << ']';
            line << '=' << values[i];
            lines.push_back(line.str());
        }
    }
    return os << utils::join(lines, '\n');
}

std::string to_string(const OptionMap& options, const bool one_line, const bool mark_modified)
{
    std::ostringstream ss {};
    ss << options;
    if (!one_line) return ss.str();
    std::vector<std::string> flags {};
    for (auto& line : utils::split(ss.str(), '\n')) {
        const auto equals = line.find('=');
        if (line.size() < 2 || equals == std::string::npos) continue;
        const bool modified {line.front() == '~'};
        line.replace(0, 2, "--");
        line[equals] = ' ';
        if (modified && mark_modified) line.insert(0, 1, '*');
        flags.push_back(std::move(line));
    }
    return utils::join(flags, ' ');
}

} // namespace options
} // namespace varcanon
