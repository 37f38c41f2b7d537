// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef population_source_hpp
#define population_source_hpp

#include <string>
#include <vector>
#include <cstddef>

#include "core/tools/population_aggregator.hpp"
#include "io/database/table_lifecycle.hpp"

namespace varcanon {

/*
 Describes how one population database lays out its INFO fields and where
 its rows are stored.
 */
struct PopulationSource
{
    std::string name;
    std::string table_name;
    ZygosityFields zygosity_fields;
    std::vector<std::string> populations;
};

PopulationSource exac_source();
PopulationSource gnomad_exomes_source();
PopulationSource gnomad_genomes_source();
PopulationSource thousand_genomes_source();

PopulationAggregator make_aggregator(const PopulationSource& source);

// (release, chrom, start, end, ref, alt, het, hom, hemi, af_popmax)
database::TableSchema make_population_schema(const PopulationSource& source, std::size_t max_allele_length);

} // namespace varcanon

#endif
