// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef mock_reference_hpp
#define mock_reference_hpp

#include <memory>
#include <string>
#include <vector>
#include <utility>

#include "io/reference/reference_reader.hpp"
#include "io/reference/reference_genome.hpp"

namespace varcanon { namespace test { namespace mock {

// In-memory contigs, in the order given
class MockReference : public io::ReferenceReader
{
public:
    using ContigSequence = std::pair<ContigName, GeneticSequence>;
    
    // chr1 = ACGTTTGCA
    MockReference();
    
    MockReference(std::vector<ContigSequence> contigs);
    
private:
    std::vector<ContigSequence> contigs_;
    
    std::unique_ptr<io::ReferenceReader> do_clone() const override;
    std::string do_name() const override;
    std::vector<io::ReferenceReader::Contig> do_fetch_contigs() const override;
    GeneticSequence do_fetch_sequence(const GenomicRegion& region) const override;
};

ReferenceGenome make_mock_reference();
ReferenceGenome make_mock_reference(std::vector<MockReference::ContigSequence> contigs);

} // namespace mock
} // namespace test
} // namespace varcanon

#endif
