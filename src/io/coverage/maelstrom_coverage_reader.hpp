// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef maelstrom_coverage_reader_hpp
#define maelstrom_coverage_reader_hpp

#include <string>
#include <vector>
#include <unordered_map>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "basics/genomic_region.hpp"
#include "coverage_source.hpp"

namespace varcanon {

/**
 Reads the per-sample coverage VCFs written by Maelstrom. Each record is a
 window with FORMAT/CV (normalized coverage) and FORMAT/MQ (mapping quality).
 The windows are loaded once on construction.
 */
class MaelstromCoverageReader : public CoverageSource
{
public:
    using Path = boost::filesystem::path;
    
    MaelstromCoverageReader() = delete;
    
    MaelstromCoverageReader(Path coverage_vcf);
    
    MaelstromCoverageReader(const MaelstromCoverageReader&)            = delete;
    MaelstromCoverageReader& operator=(const MaelstromCoverageReader&) = delete;
    
    ~MaelstromCoverageReader() override = default;
    
    const SampleName& sample() const noexcept;
    
    std::size_t num_windows() const noexcept;
    
private:
    struct Window
    {
        GenomicRegion region;
        boost::optional<double> normalized_coverage, mapping_quality;
    };
    
    struct ContigWindows
    {
        std::vector<Window> windows; // sorted by begin
        GenomicRegion::Size max_window_size = 0;
    };
    
    SampleName sample_;
    std::unordered_map<GenomicRegion::ContigName, ContigWindows> windows_;
    
    void load(const Path& coverage_vcf);
    
    CoverageSummary do_fetch(const GenomicRegion& region) const override;
};

} // namespace varcanon

#endif
