// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef mock_coverage_source_hpp
#define mock_coverage_source_hpp

#include <vector>

#include "io/coverage/coverage_source.hpp"

namespace varcanon { namespace test { namespace mock {

// Returns the same summary for every region and remembers what was asked for
class MockCoverageSource : public CoverageSource
{
public:
    MockCoverageSource(CoverageSummary summary);
    
    const std::vector<GenomicRegion>& requests() const noexcept;
    
private:
    CoverageSummary summary_;
    mutable std::vector<GenomicRegion> requests_;
    
    CoverageSummary do_fetch(const GenomicRegion& region) const override;
};

} // namespace mock
} // namespace test
} // namespace varcanon

#endif
