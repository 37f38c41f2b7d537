// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef reference_reader_hpp
#define reference_reader_hpp

#include <string>
#include <vector>
#include <memory>

#include "basics/genomic_region.hpp"

namespace varcanon { namespace io {

/*
 Source of reference bases. Implementations must be fully usable once
 constructed and must return sequence in upper case.
 */
class ReferenceReader
{
public:
    using ContigName      = GenomicRegion::ContigName;
    using GenomicSize     = GenomicRegion::Size;
    using GeneticSequence = std::string;
    
    struct Contig
    {
        ContigName name;
        GenomicSize size;
    };
    
    virtual ~ReferenceReader() = default;
    
    std::unique_ptr<ReferenceReader> clone() const { return do_clone(); }
    
    std::string name() const { return do_name(); }
    
    // In file order
    std::vector<Contig> fetch_contigs() const { return do_fetch_contigs(); }
    
    GeneticSequence fetch_sequence(const GenomicRegion& region) const { return do_fetch_sequence(region); }
    
private:
    virtual std::unique_ptr<ReferenceReader> do_clone() const = 0;
    virtual std::string do_name() const = 0;
    virtual std::vector<Contig> do_fetch_contigs() const = 0;
    virtual GeneticSequence do_fetch_sequence(const GenomicRegion& region) const = 0;
};

} // namespace io
} // namespace varcanon

#endif
