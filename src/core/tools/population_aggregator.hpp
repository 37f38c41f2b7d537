// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef population_aggregator_hpp
#define population_aggregator_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "io/variant/vcf_record.hpp"
#include "core/types/population_record.hpp"

namespace varcanon {

// INFO keys holding combined zygosity counts. An unset key means the count is always 0.
struct ZygosityFields
{
    boost::optional<std::string> het, hom, hemi;
};

/*
 Reduces per-population allele counts (AC_<pop>) and allele numbers (AN_<pop>)
 to the popmax allele frequency, and reads the combined zygosity counts.
 */
class PopulationAggregator
{
public:
    PopulationAggregator() = delete;
    
    PopulationAggregator(std::vector<std::string> populations, ZygosityFields zygosity_fields,
                         std::string ac_prefix = "AC_", std::string an_prefix = "AN_");
    
    PopulationAggregator(const PopulationAggregator&)            = default;
    PopulationAggregator& operator=(const PopulationAggregator&) = default;
    PopulationAggregator(PopulationAggregator&&)                 = default;
    PopulationAggregator& operator=(PopulationAggregator&&)      = default;
    
    ~PopulationAggregator() = default;
    
    const std::vector<std::string>& populations() const noexcept;
    
    // none if no population contributed a frequency
    boost::optional<double> popmax(const VcfRecord& record, unsigned alt_index) const;
    
    // The combined fields are used for every population
    ZygosityCounts zygosity_counts(const VcfRecord& record, unsigned alt_index) const;
    
private:
    std::vector<std::string> populations_;
    ZygosityFields zygosity_fields_;
    std::string ac_prefix_, an_prefix_;
};

} // namespace varcanon

#endif
