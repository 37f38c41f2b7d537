// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "reference_genome.hpp"

#include <utility>
#include <stdexcept>
#include <string>

#include "fasta.hpp"

namespace varcanon {

ReferenceGenome::ReferenceGenome(std::unique_ptr<io::ReferenceReader> impl)
: impl_ {std::move(impl)}
, name_ {}
, contigs_ {}
, contig_indices_ {}
{
    if (!impl_) {
        throw std::invalid_argument {"ReferenceGenome: null reader"};
    }
    name_ = impl_->name();
    contigs_ = impl_->fetch_contigs();
    contig_indices_.reserve(contigs_.size());
    for (std::size_t i {0}; i < contigs_.size(); ++i) {
        contig_indices_.emplace(contigs_[i].name, i);
    }
}

ReferenceGenome::ReferenceGenome(const ReferenceGenome& other)
: impl_ {other.impl_->clone()}
, name_ {other.name_}
, contigs_ {other.contigs_}
, contig_indices_ {other.contig_indices_}
{}

ReferenceGenome& ReferenceGenome::operator=(ReferenceGenome other)
{
    using std::swap;
    swap(impl_,           other.impl_);
    swap(name_,           other.name_);
    swap(contigs_,        other.contigs_);
    swap(contig_indices_, other.contig_indices_);
    return *this;
}

const std::string& ReferenceGenome::name() const
{
    return name_;
}

bool ReferenceGenome::has_contig(const ContigName& contig) const noexcept
{
    return contig_indices_.count(contig) == 1;
}

std::size_t ReferenceGenome::num_contigs() const noexcept
{
    return contigs_.size();
}

std::vector<ReferenceGenome::ContigName> ReferenceGenome::contig_names() const
{
    std::vector<ContigName> result {};
    result.reserve(contigs_.size());
    for (const auto& contig : contigs_) result.push_back(contig.name);
    return result;
}

ReferenceGenome::Size ReferenceGenome::contig_size(const ContigName& contig) const
{
    return contigs_[contig_indices_.at(contig)].size;
}

GenomicRegion ReferenceGenome::contig_region(const ContigName& contig) const
{
    return GenomicRegion {contig, Position {0}, this->contig_size(contig)};
}

bool ReferenceGenome::contains(const GenomicRegion& region) const noexcept
{
    const auto itr = contig_indices_.find(region.contig_name());
    return itr != std::cend(contig_indices_) && region.end() <= contigs_[itr->second].size;
}

ReferenceGenome::GeneticSequence ReferenceGenome::fetch_sequence(const GenomicRegion& region) const
{
    return impl_->fetch_sequence(region);
}

char ReferenceGenome::base_at(const ContigName& contig, const Position position) const
{
    const GenomicRegion region {contig, position, position + 1};
    if (!contains(region)) {
        throw std::out_of_range {"ReferenceGenome: position " + std::to_string(position) + " is outside " + contig};
    }
    const auto sequence = fetch_sequence(region);
    if (sequence.empty()) {
        throw std::out_of_range {"ReferenceGenome: no sequence at " + to_string(region)};
    }
    return sequence.front();
}

ReferenceGenome make_reference(boost::filesystem::path reference_path)
{
    return ReferenceGenome {std::make_unique<io::Fasta>(std::move(reference_path))};
}

} // namespace varcanon
