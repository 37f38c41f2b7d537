// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef region_parser_hpp
#define region_parser_hpp

#include <string>

#include "io/reference/reference_genome.hpp"
#include "basics/genomic_region.hpp"

namespace varcanon { namespace io {

/**
 Parses a one-based closed region string ("1", "1:1,000", "1:1,000-", "1:1,000-2,000") into a
 zero-based half-open GenomicRegion. Commas are ignored. Positions are clamped to the contig.
 
 Requires reference access to get contig sizes for partially specified regions.
 */
GenomicRegion parse_region(std::string region, const ReferenceGenome& reference);

} // namespace io
} // namespace varcanon

#endif
