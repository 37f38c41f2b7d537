// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "population_aggregator.hpp"

#include <utility>
#include <algorithm>
#include <cmath>

#include "config/common.hpp"
#include "logging/logging.hpp"
#include "multi_allelic_extractor.hpp"

namespace varcanon {

PopulationAggregator::PopulationAggregator(std::vector<std::string> populations, ZygosityFields zygosity_fields,
                                           std::string ac_prefix, std::string an_prefix)
: populations_ {std::move(populations)}
, zygosity_fields_ {std::move(zygosity_fields)}
, ac_prefix_ {std::move(ac_prefix)}
, an_prefix_ {std::move(an_prefix)}
{}

const std::vector<std::string>& PopulationAggregator::populations() const noexcept
{
    return populations_;
}

namespace {

// AN is per site, so the first value is used whatever the number of alleles
double fetch_allele_number(const VcfRecord& record, const std::string& key)
{
    return find_per_allele_stat(record, key, 1).value_or(0);
}

} // namespace

boost::optional<double> PopulationAggregator::popmax(const VcfRecord& record, const unsigned alt_index) const
{
    boost::optional<double> result {};
    for (const auto& population : populations_) {
        const auto allele_number = fetch_allele_number(record, an_prefix_ + population);
        if (allele_number <= 0) {
            auto debug_log = logging::get_debug_log();
            if (debug_log) stream(*debug_log) << "Skipping " << population << " at " << record.chrom() << ':'
                                              << record.pos() << " as " << an_prefix_ << population << " is 0";
            continue;
        }
        const auto allele_count = find_per_allele_stat(record, ac_prefix_ + population, alt_index);
        if (!allele_count) {
            logging::WarningLogger log {};
            stream(log) << "Could not update popmax (" << population << ") for allele " << alt_index << " at "
                        << record.chrom() << ':' << record.pos();
            continue;
        }
        const auto frequency = *allele_count / allele_number;
        result = result ? std::max(*result, frequency) : frequency;
    }
    return result;
}

ZygosityCounts PopulationAggregator::zygosity_counts(const VcfRecord& record, const unsigned alt_index) const
{
    const auto resolve = [&] (const boost::optional<std::string>& key) -> int {
        if (!key) return 0;
        return static_cast<int>(std::lround(resolve_per_allele_stat(record, *key, alt_index)));
    };
    ZygosityCounts result {};
    result.het  = resolve(zygosity_fields_.het);
    result.hom  = resolve(zygosity_fields_.hom);
    result.hemi = resolve(zygosity_fields_.hemi);
    return result;
}

} // namespace varcanon
