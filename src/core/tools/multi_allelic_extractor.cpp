// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "multi_allelic_extractor.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <boost/lexical_cast.hpp>

#include "config/common.hpp"
#include "io/variant/vcf_spec.hpp"
#include "logging/logging.hpp"

namespace varcanon {

namespace {

boost::optional<double> parse_stat(const VcfRecord& record, const std::string& key, const std::string& value)
{
    if (value.empty() || value == vcfspec::missingValue) return boost::none;
    try {
        return boost::lexical_cast<double>(value);
    } catch (const boost::bad_lexical_cast&) {
        logging::WarningLogger log {};
        stream(log) << "Ignoring non-numeric INFO/" << key << " value '" << value << "' at "
                    << record.chrom() << ':' << record.pos();
        return boost::none;
    }
}

} // namespace

boost::optional<double> find_per_allele_stat(const VcfRecord& record, const std::string& key, const unsigned alt_index)
{
    if (alt_index == 0 || alt_index > record.num_alt() || !record.has_info(key)) return boost::none;
    const auto& values = record.info_value(key);
    if (record.num_alt() == 1) {
        if (values.empty()) return boost::none;
        return parse_stat(record, key, values.front());
    }
    if (values.size() < alt_index) return boost::none;
    return parse_stat(record, key, values[alt_index - 1]);
}

double resolve_per_allele_stat(const VcfRecord& record, const std::string& key, const unsigned alt_index)
{
    const auto result = find_per_allele_stat(record, key, alt_index);
    if (result) return *result;
    if (record.has_info(key) && record.num_alt() > 1 && record.info_value(key).size() < alt_index) {
        logging::WarningLogger log {};
        stream(log) << "INFO/" << key << " has " << record.info_value(key).size() << " values but allele "
                    << alt_index << " was requested at " << record.chrom() << ':' << record.pos()
                    << "; using 0";
    } else {
        auto debug_log = logging::get_debug_log();
        if (debug_log) stream(*debug_log) << "No INFO/" << key << " for allele " << alt_index
                                          << " at " << record.chrom() << ':' << record.pos() << "; using 0";
    }
    return 0;
}

bool is_symbolic_allele(const std::string& allele) noexcept
{
    return allele.empty() || allele == "*" || allele == vcfspec::missingValue || allele.front() == '<'
        || std::any_of(std::cbegin(allele), std::cend(allele), [] (char c) { return c == '[' || c == ']'; });
}

MultiAllelicExtractor::MultiAllelicExtractor(const VariantNormaliser& normaliser, const std::size_t max_allele_length)
: normaliser_ {normaliser}
, max_allele_length_ {max_allele_length}
{}

std::size_t MultiAllelicExtractor::max_allele_length() const noexcept
{
    return max_allele_length_;
}

std::vector<ExtractedAllele> MultiAllelicExtractor::extract(const VcfRecord& record) const
{
    std::vector<ExtractedAllele> result {};
    result.reserve(record.num_alt());
    for (unsigned i {1}; i <= record.num_alt(); ++i) {
        const auto& alt = record.alt()[i - 1];
        if (is_symbolic_allele(alt) || is_symbolic_allele(record.ref())) {
            logging::WarningLogger log {};
            stream(log) << "Skipping symbolic allele " << record.chrom() << ':' << record.pos() << ' '
                        << record.ref() << '>' << alt;
            continue;
        }
        auto variant = extract(VariantKey {record.chrom(), record.pos() - 1, record.ref(), alt});
        if (variant) {
            result.push_back({i, std::move(*variant)});
        }
    }
    return result;
}

boost::optional<VariantKey> MultiAllelicExtractor::extract(const VariantKey& raw) const
{
    auto result = normaliser_.get().normalise_insertion(raw);
    if (result.ref().size() > max_allele_length_ || result.alt().size() > max_allele_length_) {
        logging::WarningLogger log {};
        stream(log) << "Skipping variant " << raw << " as an allele is longer than " << max_allele_length_;
        return boost::none;
    }
    return result;
}

} // namespace varcanon
