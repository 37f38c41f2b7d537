// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef variant_key_hpp
#define variant_key_hpp

#include <string>
#include <cstddef>
#include <utility>
#include <functional>
#include <iosfwd>

#include <boost/functional/hash.hpp>

#include "basics/genomic_region.hpp"
#include "concepts/comparable.hpp"

namespace varcanon {

/*
 A single genomic edit: the reference bases starting at a zero-based position
 and the bases that replace them. Either allele may be empty.
 */
class VariantKey : public Comparable<VariantKey>
{
public:
    using ContigName         = GenomicRegion::ContigName;
    using Position           = GenomicRegion::Position;
    using NucleotideSequence = std::string;
    
    VariantKey() = default;
    
    template <typename String, typename Sequence1, typename Sequence2>
    VariantKey(String&& contig, Position pos, Sequence1&& ref, Sequence2&& alt);
    
    VariantKey(const VariantKey&)            = default;
    VariantKey& operator=(const VariantKey&) = default;
    VariantKey(VariantKey&&)                 = default;
    VariantKey& operator=(VariantKey&&)      = default;
    
    ~VariantKey() = default;
    
    const ContigName& contig() const noexcept { return contig_; }
    Position pos() const noexcept { return pos_; }
    const NucleotideSequence& ref() const noexcept { return ref_; }
    const NucleotideSequence& alt() const noexcept { return alt_; }
    
    // Half open
    Position end() const noexcept { return pos_ + static_cast<Position>(ref_.size()); }
    
private:
    ContigName contig_;
    Position pos_ = 0;
    NucleotideSequence ref_, alt_;
};

template <typename String, typename Sequence1, typename Sequence2>
VariantKey::VariantKey(String&& contig, const Position pos, Sequence1&& ref, Sequence2&& alt)
: contig_ {std::forward<String>(contig)}
, pos_ {pos}
, ref_ {std::forward<Sequence1>(ref)}
, alt_ {std::forward<Sequence2>(alt)}
{}

GenomicRegion mapped_region(const VariantKey& key);

bool operator==(const VariantKey& lhs, const VariantKey& rhs) noexcept;
bool operator<(const VariantKey& lhs, const VariantKey& rhs) noexcept;

std::string to_string(const VariantKey& key);

std::ostream& operator<<(std::ostream& os, const VariantKey& key);

struct VariantKeyHash
{
    std::size_t operator()(const VariantKey& key) const noexcept
    {
        using boost::hash_combine;
        std::size_t result {};
        hash_combine(result, key.contig());
        hash_combine(result, key.pos());
        hash_combine(result, key.ref());
        hash_combine(result, key.alt());
        return result;
    }
};

} // namespace varcanon

namespace std {
    template <> struct hash<varcanon::VariantKey>
    {
        size_t operator()(const varcanon::VariantKey& key) const noexcept
        {
            return varcanon::VariantKeyHash()(key);
        }
    };
} // namespace std

#endif
