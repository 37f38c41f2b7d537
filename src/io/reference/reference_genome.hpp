// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef reference_genome_hpp
#define reference_genome_hpp

#include <string>
#include <vector>
#include <unordered_map>
#include <cstddef>
#include <memory>

#include <boost/filesystem/path.hpp>

#include "basics/genomic_region.hpp"
#include "reference_reader.hpp"

namespace varcanon {

/*
 Value type over a ReferenceReader. Contig names and sizes are read once on
 construction; sequence is fetched on demand. Copies clone the reader.
 */
class ReferenceGenome
{
public:
    using ContigName      = io::ReferenceReader::ContigName;
    using GeneticSequence = io::ReferenceReader::GeneticSequence;
    using Position        = GenomicRegion::Position;
    using Size            = GenomicRegion::Size;
    
    ReferenceGenome() = delete;
    
    ReferenceGenome(std::unique_ptr<io::ReferenceReader> impl);
    
    ReferenceGenome(const ReferenceGenome&);
    ReferenceGenome& operator=(ReferenceGenome);
    ReferenceGenome(ReferenceGenome&&)            = default;
    ReferenceGenome& operator=(ReferenceGenome&&) = default;
    
    ~ReferenceGenome() = default;
    
    const std::string& name() const;
    
    bool has_contig(const ContigName& contig) const noexcept;
    std::size_t num_contigs() const noexcept;
    std::vector<ContigName> contig_names() const;
    Size contig_size(const ContigName& contig) const;
    GenomicRegion contig_region(const ContigName& contig) const;
    
    bool contains(const GenomicRegion& region) const noexcept;
    
    GeneticSequence fetch_sequence(const GenomicRegion& region) const;
    
    // Throws std::out_of_range if the position is not on the contig
    char base_at(const ContigName& contig, Position position) const;
    
private:
    std::unique_ptr<io::ReferenceReader> impl_;
    std::string name_;
    std::vector<io::ReferenceReader::Contig> contigs_;
    std::unordered_map<ContigName, std::size_t> contig_indices_;
};

// Opens an indexed FASTA
ReferenceGenome make_reference(boost::filesystem::path reference_path);

} // namespace varcanon

#endif
