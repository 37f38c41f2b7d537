// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef population_record_hpp
#define population_record_hpp

#include <iosfwd>

#include "config/common.hpp"
#include "variant_key.hpp"

namespace varcanon {

struct ZygosityCounts
{
    int het = 0, hom = 0, hemi = 0;
};

/*
 One normalized allele of a population database together with its zygosity
 counts and popmax allele frequency.
 */
struct PopulationRecord
{
    ReleaseName release;
    VariantKey variant;
    ZygosityCounts counts;
    double af_popmax = 0.0;
};

bool operator==(const ZygosityCounts& lhs, const ZygosityCounts& rhs) noexcept;
bool operator==(const PopulationRecord& lhs, const PopulationRecord& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const ZygosityCounts& counts);
std::ostream& operator<<(std::ostream& os, const PopulationRecord& record);

} // namespace varcanon

#endif
