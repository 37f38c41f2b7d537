// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sample_genotype_hpp
#define sample_genotype_hpp

#include <string>
#include <vector>
#include <iosfwd>

#include <boost/optional.hpp>

#include "config/common.hpp"

namespace varcanon {

/*
 Caller independent genotype evidence for one sample at one structural
 variant allele. Fields the caller does not report are left unset, which is
 distinct from being reported as zero.
 */
class SampleGenotype
{
public:
    class Builder;
    
    using Count = int;
    
    SampleGenotype() = default;
    
    SampleGenotype(const SampleGenotype&)            = default;
    SampleGenotype& operator=(const SampleGenotype&) = default;
    SampleGenotype(SampleGenotype&&)                 = default;
    SampleGenotype& operator=(SampleGenotype&&)      = default;
    
    ~SampleGenotype() = default;
    
    const SampleName& sample_name() const noexcept { return sample_name_; }
    const std::string& genotype() const noexcept { return genotype_; }
    // In the order first seen, without duplicates
    const std::vector<std::string>& filters() const noexcept { return filters_; }
    boost::optional<double> genotype_quality() const noexcept { return genotype_quality_; }
    boost::optional<Count> paired_end_coverage() const noexcept { return paired_end_coverage_; }
    boost::optional<Count> paired_end_variant_support() const noexcept { return paired_end_variant_support_; }
    boost::optional<Count> split_read_coverage() const noexcept { return split_read_coverage_; }
    boost::optional<Count> split_read_variant_support() const noexcept { return split_read_variant_support_; }
    boost::optional<double> average_mapping_quality() const noexcept { return average_mapping_quality_; }
    boost::optional<Count> copy_number() const noexcept { return copy_number_; }
    boost::optional<double> average_normalized_coverage() const noexcept { return average_normalized_coverage_; }
    boost::optional<Count> point_count() const noexcept { return point_count_; }
    
    friend Builder;
    
private:
    SampleName sample_name_;
    std::string genotype_;
    std::vector<std::string> filters_;
    boost::optional<double> genotype_quality_;
    boost::optional<Count> paired_end_coverage_, paired_end_variant_support_;
    boost::optional<Count> split_read_coverage_, split_read_variant_support_;
    boost::optional<double> average_mapping_quality_;
    boost::optional<Count> copy_number_;
    boost::optional<double> average_normalized_coverage_;
    boost::optional<Count> point_count_;
};

class SampleGenotype::Builder
{
public:
    Builder() = default;
    
    Builder& set_sample_name(SampleName name);
    Builder& set_genotype(std::string genotype);
    Builder& add_filter(std::string filter);
    Builder& set_genotype_quality(boost::optional<double> quality);
    Builder& set_paired_end_coverage(boost::optional<Count> coverage);
    Builder& set_paired_end_variant_support(boost::optional<Count> support);
    Builder& set_split_read_coverage(boost::optional<Count> coverage);
    Builder& set_split_read_variant_support(boost::optional<Count> support);
    Builder& set_average_mapping_quality(boost::optional<double> quality);
    Builder& set_copy_number(boost::optional<Count> copy_number);
    Builder& set_average_normalized_coverage(boost::optional<double> coverage);
    Builder& set_point_count(boost::optional<Count> count);
    
    SampleGenotype build() const;
    SampleGenotype build_once() noexcept;
    
private:
    SampleGenotype result_;
};

bool operator==(const SampleGenotype& lhs, const SampleGenotype& rhs);

// Tab separated field values in declaration order; unset values are written as "."
std::vector<std::string> to_fields(const SampleGenotype& genotype);

std::vector<std::string> sample_genotype_field_names();

std::ostream& operator<<(std::ostream& os, const SampleGenotype& genotype);

std::string to_string(const SampleGenotype& genotype);

} // namespace varcanon

#endif
