// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef coverage_source_hpp
#define coverage_source_hpp

#include <memory>
#include <unordered_map>

#include <boost/optional.hpp>

#include "basics/genomic_region.hpp"
#include "config/common.hpp"

namespace varcanon {

struct CoverageSummary
{
    boost::optional<double> average_normalized_coverage, average_mapping_quality;
};

/**
 Per-sample coverage lookup consulted by callers whose VCFs do not carry
 coverage themselves.
 */
class CoverageSource
{
public:
    virtual ~CoverageSource() = default;
    
    // Values are unset if nothing is known about the region
    CoverageSummary fetch(const GenomicRegion& region) const { return do_fetch(region); }
    
private:
    virtual CoverageSummary do_fetch(const GenomicRegion& region) const = 0;
};

using CoverageSourceMap = std::unordered_map<SampleName, std::shared_ptr<const CoverageSource>>;

} // namespace varcanon

#endif
