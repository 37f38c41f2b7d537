// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sample_genotype.hpp"

#include <utility>
#include <algorithm>
#include <sstream>
#include <iostream>

#include "utils/string_utils.hpp"

namespace varcanon {

using Builder = SampleGenotype::Builder;

Builder& Builder::set_sample_name(SampleName name)
{
    result_.sample_name_ = std::move(name);
    return *this;
}

Builder& Builder::set_genotype(std::string genotype)
{
    result_.genotype_ = std::move(genotype);
    return *this;
}

Builder& Builder::add_filter(std::string filter)
{
    auto& filters = result_.filters_;
    if (std::find(std::cbegin(filters), std::cend(filters), filter) == std::cend(filters)) {
        filters.push_back(std::move(filter));
    }
    return *this;
}

Builder& Builder::set_genotype_quality(boost::optional<double> quality)
{
    result_.genotype_quality_ = quality;
    return *this;
}

Builder& Builder::set_paired_end_coverage(boost::optional<Count> coverage)
{
    result_.paired_end_coverage_ = coverage;
    return *this;
}

Builder& Builder::set_paired_end_variant_support(boost::optional<Count> support)
{
    result_.paired_end_variant_support_ = support;
    return *this;
}

Builder& Builder::set_split_read_coverage(boost::optional<Count> coverage)
{
    result_.split_read_coverage_ = coverage;
    return *this;
}

Builder& Builder::set_split_read_variant_support(boost::optional<Count> support)
{
    result_.split_read_variant_support_ = support;
    return *this;
}

Builder& Builder::set_average_mapping_quality(boost::optional<double> quality)
{
    result_.average_mapping_quality_ = quality;
    return *this;
}

Builder& Builder::set_copy_number(boost::optional<Count> copy_number)
{
    result_.copy_number_ = copy_number;
    return *this;
}

Builder& Builder::set_average_normalized_coverage(boost::optional<double> coverage)
{
    result_.average_normalized_coverage_ = coverage;
    return *this;
}

Builder& Builder::set_point_count(boost::optional<Count> count)
{
    result_.point_count_ = count;
    return *this;
}

SampleGenotype Builder::build() const
{
    return result_;
}

SampleGenotype Builder::build_once() noexcept
{
    return std::move(result_);
}

bool operator==(const SampleGenotype& lhs, const SampleGenotype& rhs)
{
    return lhs.sample_name() == rhs.sample_name()
        && lhs.genotype() == rhs.genotype()
        && lhs.filters() == rhs.filters()
        && lhs.genotype_quality() == rhs.genotype_quality()
        && lhs.paired_end_coverage() == rhs.paired_end_coverage()
        && lhs.paired_end_variant_support() == rhs.paired_end_variant_support()
        && lhs.split_read_coverage() == rhs.split_read_coverage()
        && lhs.split_read_variant_support() == rhs.split_read_variant_support()
        && lhs.average_mapping_quality() == rhs.average_mapping_quality()
        && lhs.copy_number() == rhs.copy_number()
        && lhs.average_normalized_coverage() == rhs.average_normalized_coverage()
        && lhs.point_count() == rhs.point_count();
}

namespace {

template <typename T>
std::string format(const boost::optional<T>& value, const std::string& unset)
{
    if (!value) return unset;
    std::ostringstream ss {};
    ss << *value;
    return ss.str();
}

} // namespace

std::vector<std::string> to_fields(const SampleGenotype& genotype)
{
    static const std::string missing {"."};
    return {
        genotype.sample_name(),
        genotype.genotype(),
        genotype.filters().empty() ? missing : utils::join(genotype.filters(), ','),
        format(genotype.genotype_quality(), missing),
        format(genotype.paired_end_coverage(), missing),
        format(genotype.paired_end_variant_support(), missing),
        format(genotype.split_read_coverage(), missing),
        format(genotype.split_read_variant_support(), missing),
        format(genotype.average_mapping_quality(), missing),
        format(genotype.copy_number(), missing),
        format(genotype.average_normalized_coverage(), missing),
        format(genotype.point_count(), missing)
    };
}

std::vector<std::string> sample_genotype_field_names()
{
    return {
        "sample", "genotype", "filters", "genotype_quality", "paired_end_coverage",
        "paired_end_variant_support", "split_read_coverage", "split_read_variant_support",
        "average_mapping_quality", "copy_number", "average_normalized_coverage", "point_count"
    };
}

std::ostream& operator<<(std::ostream& os, const SampleGenotype& genotype)
{
    static const std::string null {"null"};
    os << "SampleGenotype{"
       << "sampleName='" << genotype.sample_name() << '\''
       << ", genotype='" << genotype.genotype() << '\''
       << ", filters=[" << utils::join(genotype.filters(), ", ") << ']'
       << ", genotypeQuality=" << format(genotype.genotype_quality(), null)
       << ", pairedEndCoverage=" << format(genotype.paired_end_coverage(), null)
       << ", pairedEndVariantSupport=" << format(genotype.paired_end_variant_support(), null)
       << ", splitReadCoverage=" << format(genotype.split_read_coverage(), null)
       << ", splitReadVariantSupport=" << format(genotype.split_read_variant_support(), null)
       << ", averageMappingQuality=" << format(genotype.average_mapping_quality(), null)
       << ", copyNumber=" << format(genotype.copy_number(), null)
       << ", averageNormalizedCoverage=" << format(genotype.average_normalized_coverage(), null)
       << ", pointCount=" << format(genotype.point_count(), null)
       << '}';
    return os;
}

std::string to_string(const SampleGenotype& genotype)
{
    std::ostringstream ss {};
    ss << genotype;
    return ss.str();
}

} // namespace varcanon
