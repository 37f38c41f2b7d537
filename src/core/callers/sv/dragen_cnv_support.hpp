// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef dragen_cnv_support_hpp
#define dragen_cnv_support_hpp

#include <string>

#include "io/coverage/coverage_source.hpp"
#include "caller_support.hpp"

namespace varcanon {

/*
 DRAGEN copy number calls (##source=DRAGEN_CNV). SM is the segment mean of
 normalized coverage, BC the number of bins and PE the discordant pair counts
 at the two breakends.
 */
class DragenCnvSupport : public CallerSupport
{
public:
    DragenCnvSupport() = default;
    
    // Samples with a coverage source take their coverage and mapping quality from it
    DragenCnvSupport(CoverageSourceMap coverage);
    
    DragenCnvSupport(const DragenCnvSupport&)            = default;
    DragenCnvSupport& operator=(const DragenCnvSupport&) = default;
    DragenCnvSupport(DragenCnvSupport&&)                 = default;
    DragenCnvSupport& operator=(DragenCnvSupport&&)      = default;
    
    ~DragenCnvSupport() override = default;
    
private:
    SvCaller do_caller() const noexcept override;
    bool do_is_compatible(const VcfHeader& header) const override;
    std::string do_version(const VcfReader& reader) const override;
    void do_build_sample_genotype(const VcfRecord& record, unsigned alt_index, const SampleName& sample,
                                  SampleGenotype::Builder& result) const override;
    
    CoverageSourceMap coverage_;
};

} // namespace varcanon

#endif
