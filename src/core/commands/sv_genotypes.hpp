// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sv_genotypes_hpp
#define sv_genotypes_hpp

#include <iosfwd>
#include <cstddef>

#include <boost/filesystem/path.hpp>

#include "io/variant/vcf_reader.hpp"
#include "io/coverage/coverage_source.hpp"
#include "core/callers/sv/caller_support.hpp"

namespace varcanon {

struct SvGenotypesComponents
{
    boost::filesystem::path sv_path;
    CoverageSourceMap coverage;
    boost::filesystem::path output;
};

/*
 Writes a header line then one line per record, alternate allele and sample:
 chrom, pos, end, alt_index and the SampleGenotype fields. Returns the number
 of genotype lines written.
 */
std::size_t write_sample_genotypes(const VcfReader& reader, const CallerSupport& support, std::ostream& out);

void run_sv_genotypes(const SvGenotypesComponents& components);

} // namespace varcanon

#endif
