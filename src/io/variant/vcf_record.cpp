// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "vcf_record.hpp"

#include <algorithm>
#include <stdexcept>

namespace varcanon {

bool VcfRecord::has_info(const KeyType& key) const noexcept
{
    return info_.find(key) != std::cend(info_);
}

const VcfRecord::Values& VcfRecord::info_value(const KeyType& key) const
{
    const auto itr = info_.find(key);
    if (itr == std::cend(info_)) {
        throw std::out_of_range {"VcfRecord: no INFO/" + key + " at " + chrom() + ':' + std::to_string(pos())};
    }
    return itr->second;
}

bool VcfRecord::has_format(const KeyType& key) const noexcept
{
    return std::find(std::cbegin(format_), std::cend(format_), key) != std::cend(format_);
}

const VcfRecord::Sample& VcfRecord::sample(const SampleName& name) const
{
    const auto itr = samples_.find(name);
    if (itr == std::cend(samples_)) {
        throw std::out_of_range {"VcfRecord: no sample " + name};
    }
    return itr->second;
}

bool VcfRecord::has_sample(const SampleName& sample) const noexcept
{
    return samples_.find(sample) != std::cend(samples_);
}

bool VcfRecord::has_genotype(const SampleName& sample) const noexcept
{
    const auto itr = samples_.find(sample);
    return itr != std::cend(samples_) && itr->second.genotype;
}

const std::vector<VcfRecord::AlleleIndex>& VcfRecord::genotype(const SampleName& name) const
{
    const auto& data = sample(name);
    if (!data.genotype) throw std::out_of_range {"VcfRecord: sample " + name + " has no genotype"};
    return *data.genotype;
}

bool VcfRecord::is_sample_phased(const SampleName& name) const
{
    return sample(name).phased;
}

bool VcfRecord::has_sample_value(const SampleName& sample, const KeyType& key) const noexcept
{
    const auto itr = samples_.find(sample);
    return itr != std::cend(samples_) && itr->second.values.count(key) > 0;
}

const VcfRecord::Values& VcfRecord::get_sample_value(const SampleName& name, const KeyType& key) const
{
    const auto& values = sample(name).values;
    const auto itr = values.find(key);
    if (itr == std::cend(values)) {
        throw std::out_of_range {"VcfRecord: sample " + name + " has no FORMAT/" + key};
    }
    return itr->second;
}

// VcfRecord::Builder

VcfRecord::Builder& VcfRecord::Builder::set_chrom(GenomicRegion::ContigName chrom)
{
    chrom_ = std::move(chrom);
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_pos(const GenomicRegion::Position pos)
{
    if (pos == 0) throw std::invalid_argument {"VcfRecord::Builder: POS is one based"};
    pos_ = pos;
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_end(const GenomicRegion::Position end)
{
    end_ = end;
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_ref(NucleotideSequence ref)
{
    record_.ref_ = std::move(ref);
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_alt(NucleotideSequence alt)
{
    record_.alt_ = {std::move(alt)};
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_alt(std::vector<NucleotideSequence> alts)
{
    record_.alt_ = std::move(alts);
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_info(KeyType key, ValueType value)
{
    return set_info(std::move(key), Values {std::move(value)});
}

VcfRecord::Builder& VcfRecord::Builder::set_info(KeyType key, Values values)
{
    record_.info_[std::move(key)] = std::move(values);
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_format(std::vector<KeyType> keys)
{
    record_.format_ = std::move(keys);
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_genotype(const SampleName& sample, std::vector<AlleleIndex> alleles,
                                                     const Phasing phasing)
{
    auto& data = record_.samples_[sample];
    data.genotype = std::move(alleles);
    data.phased = phasing == Phasing::phased;
    return *this;
}

VcfRecord::Builder& VcfRecord::Builder::set_format(const SampleName& sample, KeyType key, Values values)
{
    record_.samples_[sample].values[std::move(key)] = std::move(values);
    return *this;
}

VcfRecord VcfRecord::Builder::build_once()
{
    const auto begin = pos_ - 1;
    const auto ref_end = begin + static_cast<GenomicRegion::Position>(record_.ref_.size());
    record_.region_ = GenomicRegion {std::move(chrom_), begin, std::max(begin, end_ ? *end_ : ref_end)};
    return std::move(record_);
}

} // namespace varcanon
