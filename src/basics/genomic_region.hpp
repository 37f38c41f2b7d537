// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef genomic_region_hpp
#define genomic_region_hpp

#include <string>
#include <cstdint>
#include <stdexcept>
#include <ostream>
#include <utility>

#include "concepts/comparable.hpp"

namespace varcanon {

/**
 A half-open interval [begin, end) of zero-based positions on one contig.
 Empty regions (begin == end) mark the point between two bases.
 */
class GenomicRegion : public Comparable<GenomicRegion>
{
public:
    using ContigName = std::string;
    using Position   = std::uint32_t;
    using Size       = std::uint32_t;
    
    GenomicRegion() = default;
    
    explicit GenomicRegion(ContigName contig, const Position begin, const Position end)
    : contig_ {std::move(contig)}, begin_ {begin}, end_ {end}
    {
        if (end < begin) {
            throw std::invalid_argument {"GenomicRegion: " + contig_ + " region ends at " + std::to_string(end)
                                         + " before it begins at " + std::to_string(begin)};
        }
    }
    
    const ContigName& contig_name() const noexcept { return contig_; }
    Position begin() const noexcept { return begin_; }
    Position end() const noexcept { return end_; }
    
private:
    ContigName contig_;
    Position begin_ = 0, end_ = 0;
};

inline GenomicRegion::Size size(const GenomicRegion& region) noexcept
{
    return region.end() - region.begin();
}

inline bool is_empty(const GenomicRegion& region) noexcept
{
    return size(region) == 0;
}

inline bool contains(const GenomicRegion& outer, const GenomicRegion& inner) noexcept
{
    return outer.contig_name() == inner.contig_name()
        && outer.begin() <= inner.begin() && inner.end() <= outer.end();
}

// Empty regions overlap anything they touch
inline bool overlaps(const GenomicRegion& a, const GenomicRegion& b) noexcept
{
    if (a.contig_name() != b.contig_name()) return false;
    const bool touching_counts {is_empty(a) || is_empty(b)};
    return touching_counts ? (a.begin() <= b.end() && b.begin() <= a.end())
                           : (a.begin() < b.end() && b.begin() < a.end());
}

inline std::string to_string(const GenomicRegion& region)
{
    return region.contig_name() + ':' + std::to_string(region.begin()) + '-' + std::to_string(region.end());
}

// chr:first-last with one-based inclusive positions, as htslib expects
inline std::string to_one_based_string(const GenomicRegion& region)
{
    return region.contig_name() + ':' + std::to_string(region.begin() + 1) + '-' + std::to_string(region.end());
}

inline bool operator==(const GenomicRegion& lhs, const GenomicRegion& rhs) noexcept
{
    return lhs.begin() == rhs.begin() && lhs.end() == rhs.end() && lhs.contig_name() == rhs.contig_name();
}

inline bool operator<(const GenomicRegion& lhs, const GenomicRegion& rhs) noexcept
{
    if (lhs.contig_name() != rhs.contig_name()) return lhs.contig_name() < rhs.contig_name();
    if (lhs.begin() != rhs.begin()) return lhs.begin() < rhs.begin();
    return lhs.end() < rhs.end();
}

inline std::ostream& operator<<(std::ostream& os, const GenomicRegion& region)
{
    return os << to_string(region);
}

} // namespace varcanon

#endif
