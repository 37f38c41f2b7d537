// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef manta_support_hpp
#define manta_support_hpp

#include <string>

#include "caller_support.hpp"

namespace varcanon {

// Manta calls (##source=GenerateSVCandidates <version>)
class MantaSupport : public CallerSupport
{
public:
    MantaSupport() = default;
    
    ~MantaSupport() override = default;
    
private:
    SvCaller do_caller() const noexcept override;
    bool do_is_compatible(const VcfHeader& header) const override;
    std::string do_version(const VcfReader& reader) const override;
    void do_build_sample_genotype(const VcfRecord& record, unsigned alt_index, const SampleName& sample,
                                  SampleGenotype::Builder& result) const override;
};

} // namespace varcanon

#endif
