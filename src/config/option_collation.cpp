// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <string>
#include <iterator>
#include <algorithm>
#include <utility>
#include <memory>
#include <sstream>

#include <boost/filesystem/path.hpp>
#include <boost/filesystem/operations.hpp>

#include "logging/logging.hpp"
#include "io/region/region_parser.hpp"
#include "io/coverage/maelstrom_coverage_reader.hpp"
#include "exceptions/user_error.hpp"
#include "exceptions/missing_file_error.hpp"

namespace varcanon { namespace options {

bool is_set(const std::string& option, const OptionMap& options) noexcept
{
    return options.count(option) == 1;
}

// unsigned are banned from the option map to prevent user input errors, but once the option
// map is passed they are all safe
unsigned as_unsigned(const std::string& option, const OptionMap& options)
{
    return static_cast<unsigned>(options.at(option).as<int>());
}

bool is_run_command(const OptionMap& options)
{
    return !is_set("help", options) && !is_set("version", options) && is_set("command", options);
}

Command get_command(const OptionMap& options)
{
    return options.at("command").as<Command>();
}

bool is_debug_mode(const OptionMap& options)
{
    return is_set("debug", options);
}

bool is_trace_mode(const OptionMap& options)
{
    return is_set("trace", options);
}

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    if (is_debug_mode(options)) {
        return resolve_path(options.at("debug").as<fs::path>(), options);
    }
    return boost::none;
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    if (is_trace_mode(options)) {
        return resolve_path(options.at("trace").as<fs::path>(), options);
    }
    return boost::none;
}

namespace {

class MissingInputFile : public MissingFileError
{
public:
    MissingInputFile(fs::path p, std::string type, const std::string& option)
    : MissingFileError {std::move(p), std::move(type)}
    {
        set_source("the command line option --" + option);
    }
};

fs::path get_input_path(const OptionMap& options, const std::string& option, std::string type)
{
    auto result = resolve_path(options.at(option).as<fs::path>(), options);
    if (!fs::exists(result)) {
        throw MissingInputFile {std::move(result), std::move(type), option};
    }
    return result;
}

std::vector<fs::path> get_input_paths(const OptionMap& options, const std::string& option, const std::string& type)
{
    std::vector<fs::path> result {};
    if (is_set(option, options)) {
        for (const auto& path : options.at(option).as<std::vector<fs::path>>()) {
            auto resolved_path = resolve_path(path, options);
            if (!fs::exists(resolved_path)) {
                throw MissingInputFile {std::move(resolved_path), type, option};
            }
            result.push_back(std::move(resolved_path));
        }
    }
    return result;
}

class DuplicateCoverageSample : public UserError
{
    std::string do_where() const override
    {
        return "make_coverage_sources";
    }
    
    std::string do_why() const override
    {
        return "More than one coverage file was given for sample " + sample_;
    }
    
    std::string do_help() const override
    {
        return "give each sample at most one --coverage-path";
    }
    
    SampleName sample_;
public:
    DuplicateCoverageSample(SampleName sample) : sample_ {std::move(sample)} {}
};

} // namespace

ReferenceGenome make_reference(const OptionMap& options)
{
    const auto reference_path = get_input_path(options, "ref-path", "reference");
    try {
        return ::varcanon::make_reference(reference_path);
    } catch (MissingFileError& e) {
        e.set_source("the command line option --ref-path");
        throw;
    }
}

fs::path get_database_path(const OptionMap& options)
{
    return resolve_path(options.at("db-path").as<fs::path>(), options);
}

ReleaseName get_release(const OptionMap& options)
{
    return options.at("release").as<std::string>();
}

std::size_t get_max_allele_length(const OptionMap& options)
{
    return as_unsigned("max-allele-length", options);
}

boost::optional<GenomicRegion> get_import_region(const OptionMap& options, const ReferenceGenome& reference)
{
    if (is_set("region", options)) {
        return io::parse_region(options.at("region").as<std::string>(), reference);
    }
    return boost::none;
}

std::vector<PopulationImport> get_population_imports(const OptionMap& options)
{
    std::vector<PopulationImport> result {};
    if (is_set("exac-path", options)) {
        result.push_back({exac_source(), {get_input_path(options, "exac-path", "ExAC")}});
    }
    if (is_set("gnomad-exomes-path", options)) {
        result.push_back({gnomad_exomes_source(), {get_input_path(options, "gnomad-exomes-path", "gnomAD exomes")}});
    }
    if (is_set("gnomad-genomes-path", options)) {
        result.push_back({gnomad_genomes_source(), {get_input_path(options, "gnomad-genomes-path", "gnomAD genomes")}});
    }
    auto thousand_genomes = get_input_paths(options, "thousand-genomes-path", "1000 Genomes");
    if (!thousand_genomes.empty()) {
        result.push_back({thousand_genomes_source(), std::move(thousand_genomes)});
    }
    return result;
}

std::vector<fs::path> get_clinvar_paths(const OptionMap& options)
{
    return get_input_paths(options, "clinvar-path", "ClinVar");
}

fs::path get_sv_path(const OptionMap& options)
{
    return get_input_path(options, "sv-path", "structural variant");
}

CoverageSourceMap make_coverage_sources(const OptionMap& options)
{
    CoverageSourceMap result {};
    if (!is_set("coverage-path", options)) return result;
    for (const auto& coverage : options.at("coverage-path").as<std::vector<CoveragePath>>()) {
        if (result.count(coverage.sample) > 0) {
            throw DuplicateCoverageSample {coverage.sample};
        }
        auto path = resolve_path(coverage.path, options);
        if (!fs::exists(path)) {
            throw MissingInputFile {std::move(path), "coverage", "coverage-path"};
        }
        auto reader = std::make_shared<MaelstromCoverageReader>(std::move(path));
        if (reader->sample() != coverage.sample) {
            logging::WarningLogger log {};
            stream(log) << "The coverage file given for sample " << coverage.sample
                        << " holds sample " << reader->sample();
        }
        result.emplace(coverage.sample, std::move(reader));
    }
    return result;
}

fs::path get_output_path(const OptionMap& options)
{
    return resolve_path(options.at("output").as<fs::path>(), options);
}

InitDbComponents collate_init_db_components(const OptionMap& options)
{
    // All inputs are checked before the database is opened
    auto populations = get_population_imports(options);
    auto clinvar = get_clinvar_paths(options);
    auto reference = make_reference(options);
    auto region = get_import_region(options, reference);
    if (populations.empty() && clinvar.empty()) {
        logging::WarningLogger log {};
        log << "No datasets were given so the database will not be changed";
    }
    return InitDbComponents {
        get_database_path(options),
        std::move(reference),
        get_release(options),
        get_max_allele_length(options),
        std::move(region),
        std::move(populations),
        std::move(clinvar)
    };
}

SvGenotypesComponents collate_sv_genotypes_components(const OptionMap& options)
{
    return SvGenotypesComponents {
        get_sv_path(options),
        make_coverage_sources(options),
        get_output_path(options)
    };
}

} // namespace options
} // namespace varcanon
