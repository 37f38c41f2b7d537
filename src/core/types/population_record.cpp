// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "population_record.hpp"

#include <ostream>

namespace varcanon {

bool operator==(const ZygosityCounts& lhs, const ZygosityCounts& rhs) noexcept
{
    return lhs.het == rhs.het && lhs.hom == rhs.hom && lhs.hemi == rhs.hemi;
}

bool operator==(const PopulationRecord& lhs, const PopulationRecord& rhs) noexcept
{
    return lhs.release == rhs.release && lhs.variant == rhs.variant && lhs.counts == rhs.counts
        && lhs.af_popmax == rhs.af_popmax;
}

std::ostream& operator<<(std::ostream& os, const ZygosityCounts& counts)
{
    os << "het=" << counts.het << " hom=" << counts.hom << " hemi=" << counts.hemi;
    return os;
}

std::ostream& operator<<(std::ostream& os, const PopulationRecord& record)
{
    os << record.release << ' ' << record.variant << ' ' << record.counts << " af_popmax=" << record.af_popmax;
    return os;
}

} // namespace varcanon
