// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef vcf_record_hpp
#define vcf_record_hpp

#include <string>
#include <vector>
#include <utility>

#include <boost/optional.hpp>
#include <boost/container/flat_map.hpp>

#include "basics/genomic_region.hpp"

namespace varcanon {

/*
 One VCF data line. Only the columns the import and genotype commands
 consume are kept: CHROM, POS, REF, ALT, INFO and the per-sample columns.
 */
class VcfRecord
{
public:
    class Builder;
    
    using NucleotideSequence = std::string;
    using SampleName         = std::string;
    using KeyType            = std::string;
    using ValueType          = std::string;
    using AlleleIndex        = boost::optional<unsigned>; // none for '.'
    using Values             = std::vector<ValueType>;
    
    VcfRecord() = default;
    
    // [POS - 1, END) where END is INFO/END for symbolic records
    const GenomicRegion& mapped_region() const noexcept { return region_; }
    
    const GenomicRegion::ContigName& chrom() const noexcept { return region_.contig_name(); }
    GenomicRegion::Position pos() const noexcept { return region_.begin() + 1; }
    const NucleotideSequence& ref() const noexcept { return ref_; }
    const std::vector<NucleotideSequence>& alt() const noexcept { return alt_; }
    unsigned num_alt() const noexcept { return static_cast<unsigned>(alt_.size()); }
    
    bool has_info(const KeyType& key) const noexcept;
    // Flags hold the single value "1"
    const Values& info_value(const KeyType& key) const;
    
    const std::vector<KeyType>& format() const noexcept { return format_; }
    bool has_format(const KeyType& key) const noexcept;
    
    unsigned num_samples() const noexcept { return static_cast<unsigned>(samples_.size()); }
    bool has_sample(const SampleName& sample) const noexcept;
    bool has_genotype(const SampleName& sample) const noexcept;
    const std::vector<AlleleIndex>& genotype(const SampleName& sample) const;
    bool is_sample_phased(const SampleName& sample) const;
    bool has_sample_value(const SampleName& sample, const KeyType& key) const noexcept;
    const Values& get_sample_value(const SampleName& sample, const KeyType& key) const;
    
private:
    struct Sample
    {
        boost::optional<std::vector<AlleleIndex>> genotype;
        bool phased = false;
        boost::container::flat_map<KeyType, Values> values;
    };
    
    GenomicRegion region_;
    NucleotideSequence ref_;
    std::vector<NucleotideSequence> alt_;
    boost::container::flat_map<KeyType, Values> info_;
    std::vector<KeyType> format_;
    boost::container::flat_map<SampleName, Sample> samples_;
    
    const Sample& sample(const SampleName& name) const;
    
    friend Builder;
};

class VcfRecord::Builder
{
public:
    enum class Phasing { phased, unphased };
    
    Builder() = default;
    
    Builder& set_chrom(GenomicRegion::ContigName chrom);
    Builder& set_pos(GenomicRegion::Position pos); // one based
    Builder& set_end(GenomicRegion::Position end); // zero based exclusive
    Builder& set_ref(NucleotideSequence ref);
    Builder& set_alt(NucleotideSequence alt);
    Builder& set_alt(std::vector<NucleotideSequence> alts);
    Builder& set_info(KeyType key, ValueType value);
    Builder& set_info(KeyType key, Values values);
    Builder& set_format(std::vector<KeyType> keys);
    Builder& set_genotype(const SampleName& sample, std::vector<AlleleIndex> alleles, Phasing phasing);
    Builder& set_format(const SampleName& sample, KeyType key, Values values);
    
    VcfRecord build_once();
    
private:
    GenomicRegion::ContigName chrom_;
    GenomicRegion::Position pos_ = 1;
    boost::optional<GenomicRegion::Position> end_;
    VcfRecord record_;
};

} // namespace varcanon

#endif
