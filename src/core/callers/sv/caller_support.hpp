// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef caller_support_hpp
#define caller_support_hpp

#include <string>
#include <vector>
#include <cstddef>

#include <boost/optional.hpp>

#include "config/common.hpp"
#include "io/variant/vcf_header.hpp"
#include "io/variant/vcf_record.hpp"
#include "io/variant/vcf_reader.hpp"
#include "core/types/sample_genotype.hpp"
#include "sv_caller.hpp"

namespace varcanon {

/*
 The dialect of one structural variant caller: how to recognise its VCFs, where
 it records its version, and how its FORMAT fields map onto a SampleGenotype.
 */
class CallerSupport
{
public:
    CallerSupport() = default;
    
    CallerSupport(const CallerSupport&)            = default;
    CallerSupport& operator=(const CallerSupport&) = default;
    CallerSupport(CallerSupport&&)                 = default;
    CallerSupport& operator=(CallerSupport&&)      = default;
    
    virtual ~CallerSupport() = default;
    
    SvCaller caller() const noexcept { return do_caller(); }
    
    bool is_compatible(const VcfHeader& header) const { return do_is_compatible(header); }
    
    // Free text, reported as written by the caller
    std::string version(const VcfReader& reader) const { return do_version(reader); }
    
    // alt_index is one based
    SampleGenotype build_sample_genotype(const VcfRecord& record, unsigned alt_index, const SampleName& sample) const;
    
private:
    virtual SvCaller do_caller() const noexcept = 0;
    virtual bool do_is_compatible(const VcfHeader& header) const = 0;
    virtual std::string do_version(const VcfReader& reader) const = 0;
    // The builder arrives with the sample name, genotype and filters set
    virtual void do_build_sample_genotype(const VcfRecord& record, unsigned alt_index, const SampleName& sample,
                                          SampleGenotype::Builder& result) const = 0;
};

// Each called allele is written '.', '1' if it is alt_index, and '0' otherwise
std::string make_genotype_string(const VcfRecord& record, const SampleName& sample, unsigned alt_index);

// FORMAT/FT split on ';' without the missing value marker
std::vector<std::string> extract_filters(const VcfRecord& record, const SampleName& sample);

boost::optional<int> get_int(const VcfRecord& record, const SampleName& sample, const std::string& key,
                             std::size_t index = 0);
boost::optional<double> get_double(const VcfRecord& record, const SampleName& sample, const std::string& key,
                                   std::size_t index = 0);
// Sum of all present values, none if there are none
boost::optional<int> sum_ints(const VcfRecord& record, const SampleName& sample, const std::string& key);

bool has_source(const VcfHeader& header, const std::string& source);

// The value of key in the first ##tag=<...> line that has one
boost::optional<std::string> find_structured_value(const VcfHeader& header, const std::string& tag,
                                                   const std::string& key);

} // namespace varcanon

#endif
