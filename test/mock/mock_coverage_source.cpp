// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "mock_coverage_source.hpp"

#include <utility>

namespace varcanon { namespace test { namespace mock {

MockCoverageSource::MockCoverageSource(CoverageSummary summary)
: summary_ {std::move(summary)}
{}

const std::vector<GenomicRegion>& MockCoverageSource::requests() const noexcept
{
    return requests_;
}

CoverageSummary MockCoverageSource::do_fetch(const GenomicRegion& region) const
{
    requests_.push_back(region);
    return summary_;
}

} // namespace mock
} // namespace test
} // namespace varcanon
