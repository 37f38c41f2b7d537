// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef init_db_hpp
#define init_db_hpp

#include <vector>
#include <cstddef>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "config/common.hpp"
#include "basics/genomic_region.hpp"
#include "io/reference/reference_genome.hpp"
#include "core/importers/population_source.hpp"

namespace varcanon {

struct PopulationImport
{
    PopulationSource source;
    std::vector<boost::filesystem::path> vcfs;
};

struct InitDbComponents
{
    boost::filesystem::path database;
    ReferenceGenome reference;
    ReleaseName release;
    std::size_t max_allele_length;
    boost::optional<GenomicRegion> region;
    std::vector<PopulationImport> populations;
    std::vector<boost::filesystem::path> clinvar;
};

// Datasets without inputs are left untouched in the database
void run_init_db(InitDbComponents& components);

} // namespace varcanon

#endif
