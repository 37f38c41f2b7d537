// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef fasta_hpp
#define fasta_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/filesystem/path.hpp>

#include <htslib/faidx.h>

#include "reference_reader.hpp"

namespace varcanon { namespace io {

/**
 Reads bases from a faidx indexed FASTA. The name is the file stem.
 */
class Fasta : public ReferenceReader
{
public:
    using Path = boost::filesystem::path;
    
    Fasta() = delete;
    
    Fasta(Path fasta_path);
    
    Fasta(const Fasta&);
    Fasta& operator=(Fasta);
    Fasta(Fasta&&)            = default;
    Fasta& operator=(Fasta&&) = default;
    
    ~Fasta() override = default;
    
private:
    struct FaidxDeleter
    {
        void operator()(faidx_t* index) const;
    };
    
    Path path_;
    std::unique_ptr<faidx_t, FaidxDeleter> index_;
    
    std::unique_ptr<ReferenceReader> do_clone() const override;
    std::string do_name() const override;
    std::vector<Contig> do_fetch_contigs() const override;
    GeneticSequence do_fetch_sequence(const GenomicRegion& region) const override;
};

} // namespace io
} // namespace varcanon

#endif
