// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "variant_key.hpp"

#include <tuple>
#include <ostream>

namespace varcanon {

GenomicRegion mapped_region(const VariantKey& key)
{
    return GenomicRegion {key.contig(), key.pos(), key.end()};
}

bool operator==(const VariantKey& lhs, const VariantKey& rhs) noexcept
{
    return lhs.pos() == rhs.pos() && lhs.contig() == rhs.contig() && lhs.ref() == rhs.ref() && lhs.alt() == rhs.alt();
}

bool operator<(const VariantKey& lhs, const VariantKey& rhs) noexcept
{
    if (lhs.contig() != rhs.contig()) return lhs.contig() < rhs.contig();
    if (lhs.pos() != rhs.pos()) return lhs.pos() < rhs.pos();
    return std::tie(lhs.ref(), lhs.alt()) < std::tie(rhs.ref(), rhs.alt());
}

std::string to_string(const VariantKey& key)
{
    return key.contig() + ':' + std::to_string(key.pos()) + ' ' + (key.ref().empty() ? "-" : key.ref())
           + '>' + (key.alt().empty() ? "-" : key.alt());
}

std::ostream& operator<<(std::ostream& os, const VariantKey& key)
{
    os << to_string(key);
    return os;
}

} // namespace varcanon
