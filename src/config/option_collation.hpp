// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <vector>
#include <cstddef>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

#include "common.hpp"
#include "option_parser.hpp"
#include "basics/genomic_region.hpp"
#include "io/reference/reference_genome.hpp"
#include "io/coverage/coverage_source.hpp"
#include "core/commands/init_db.hpp"
#include "core/commands/sv_genotypes.hpp"

namespace fs = boost::filesystem;

namespace varcanon { namespace options {

bool is_run_command(const OptionMap& options);

Command get_command(const OptionMap& options);

bool is_debug_mode(const OptionMap& options);
bool is_trace_mode(const OptionMap& options);

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options);

ReferenceGenome make_reference(const OptionMap& options);

fs::path get_database_path(const OptionMap& options);

ReleaseName get_release(const OptionMap& options);

std::size_t get_max_allele_length(const OptionMap& options);

boost::optional<GenomicRegion> get_import_region(const OptionMap& options, const ReferenceGenome& reference);

// Only the datasets given on the command line, in a fixed order
std::vector<PopulationImport> get_population_imports(const OptionMap& options);

std::vector<fs::path> get_clinvar_paths(const OptionMap& options);

fs::path get_sv_path(const OptionMap& options);

CoverageSourceMap make_coverage_sources(const OptionMap& options);

fs::path get_output_path(const OptionMap& options);

InitDbComponents collate_init_db_components(const OptionMap& options);

SvGenotypesComponents collate_sv_genotypes_components(const OptionMap& options);

} // namespace options
} // namespace varcanon

#endif
