// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "caller_support.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "io/variant/vcf_spec.hpp"
#include "utils/string_utils.hpp"

namespace varcanon {

SampleGenotype CallerSupport::build_sample_genotype(const VcfRecord& record, const unsigned alt_index,
                                                    const SampleName& sample) const
{
    if (!record.has_sample(sample)) {
        throw std::invalid_argument {"CallerSupport: no sample " + sample + " in record at " + record.chrom()
                                     + ':' + std::to_string(record.pos())};
    }
    SampleGenotype::Builder result {};
    result.set_sample_name(sample);
    result.set_genotype(make_genotype_string(record, sample, alt_index));
    for (auto& filter : extract_filters(record, sample)) {
        result.add_filter(std::move(filter));
    }
    do_build_sample_genotype(record, alt_index, sample, result);
    return result.build_once();
}

std::string make_genotype_string(const VcfRecord& record, const SampleName& sample, const unsigned alt_index)
{
    if (!record.has_genotype(sample)) {
        return vcfspec::missingValue;
    }
    const auto& alleles = record.genotype(sample);
    if (alleles.empty()) return vcfspec::missingValue;
    std::vector<std::string> calls(alleles.size());
    std::transform(std::cbegin(alleles), std::cend(alleles), std::begin(calls),
                   [alt_index] (const VcfRecord::AlleleIndex& allele) -> std::string {
                       if (!allele) return vcfspec::missingValue;
                       return *allele == alt_index ? "1" : "0";
                   });
    const auto seperator = record.is_sample_phased(sample) ? vcfspec::format::phasedSeperator
                                                           : vcfspec::format::unphasedSeperator;
    return utils::join(calls, seperator);
}

std::vector<std::string> extract_filters(const VcfRecord& record, const SampleName& sample)
{
    std::vector<std::string> result {};
    if (!record.has_sample_value(sample, vcfspec::format::filter)) return result;
    for (const auto& value : record.get_sample_value(sample, vcfspec::format::filter)) {
        for (auto& filter : utils::split(value, vcfspec::filter::seperator)) {
            if (!filter.empty() && filter != vcfspec::missingValue) {
                result.push_back(std::move(filter));
            }
        }
    }
    return result;
}

namespace {

template <typename T>
boost::optional<T> get_value(const VcfRecord& record, const SampleName& sample, const std::string& key,
                             const std::size_t index)
{
    if (!record.has_sample_value(sample, key)) return boost::none;
    const auto& values = record.get_sample_value(sample, key);
    if (index >= values.size() || values[index] == vcfspec::missingValue) return boost::none;
    try {
        return boost::lexical_cast<T>(values[index]);
    } catch (const boost::bad_lexical_cast&) {
        return boost::none;
    }
}

} // namespace

boost::optional<int> get_int(const VcfRecord& record, const SampleName& sample, const std::string& key,
                             const std::size_t index)
{
    return get_value<int>(record, sample, key, index);
}

boost::optional<double> get_double(const VcfRecord& record, const SampleName& sample, const std::string& key,
                                   const std::size_t index)
{
    return get_value<double>(record, sample, key, index);
}

boost::optional<int> sum_ints(const VcfRecord& record, const SampleName& sample, const std::string& key)
{
    if (!record.has_sample_value(sample, key)) return boost::none;
    boost::optional<int> result {};
    const auto num_values = record.get_sample_value(sample, key).size();
    for (std::size_t i {0}; i < num_values; ++i) {
        const auto value = get_int(record, sample, key, i);
        if (value) result = result.value_or(0) + *value;
    }
    return result;
}

bool has_source(const VcfHeader& header, const std::string& source)
{
    const auto sources = header.get_all(vcfspec::header::source);
    return std::find(std::cbegin(sources), std::cend(sources), source) != std::cend(sources);
}

boost::optional<std::string> find_structured_value(const VcfHeader& header, const std::string& tag,
                                                   const std::string& key)
{
    for (const auto& field : header.structured_fields(tag)) {
        const auto itr = field.find(key);
        if (itr != std::cend(field)) return itr->second;
    }
    return boost::none;
}

} // namespace varcanon
