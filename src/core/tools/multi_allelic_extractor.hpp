// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef multi_allelic_extractor_hpp
#define multi_allelic_extractor_hpp

#include <string>
#include <vector>
#include <cstddef>
#include <functional>

#include <boost/optional.hpp>

#include "io/variant/vcf_record.hpp"
#include "core/types/variant_key.hpp"
#include "variant_normaliser.hpp"

namespace varcanon {

/*
 Per-allele INFO statistics are a bare scalar on biallelic records and a list
 with one entry per alternative allele otherwise. alt_index is one based.
 
 Returns none if the field is absent, missing, non-numeric, or has no entry
 for alt_index.
 */
boost::optional<double> find_per_allele_stat(const VcfRecord& record, const std::string& key, unsigned alt_index);

// As above but an absent entry is taken to be 0. A list that is too short is logged as a warning.
double resolve_per_allele_stat(const VcfRecord& record, const std::string& key, unsigned alt_index);

struct ExtractedAllele
{
    unsigned alt_index; // one based
    VariantKey variant; // normalised with an anchor base
};

/*
 Splits a multi-allelic record into one normalised variant per alternative
 allele. Alleles that cannot be stored (too long, symbolic) are skipped.
 */
class MultiAllelicExtractor
{
public:
    MultiAllelicExtractor() = delete;
    
    MultiAllelicExtractor(const VariantNormaliser& normaliser, std::size_t max_allele_length);
    
    MultiAllelicExtractor(const MultiAllelicExtractor&)            = default;
    MultiAllelicExtractor& operator=(const MultiAllelicExtractor&) = default;
    MultiAllelicExtractor(MultiAllelicExtractor&&)                 = default;
    MultiAllelicExtractor& operator=(MultiAllelicExtractor&&)      = default;
    
    ~MultiAllelicExtractor() = default;
    
    std::size_t max_allele_length() const noexcept;
    
    std::vector<ExtractedAllele> extract(const VcfRecord& record) const;
    
    // Normalises one allele; none if it is skipped
    boost::optional<VariantKey> extract(const VariantKey& raw) const;
    
private:
    std::reference_wrapper<const VariantNormaliser> normaliser_;
    std::size_t max_allele_length_;
};

bool is_symbolic_allele(const std::string& allele) noexcept;

} // namespace varcanon

#endif
