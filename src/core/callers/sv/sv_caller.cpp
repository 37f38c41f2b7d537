// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sv_caller.hpp"

#include <ostream>

namespace varcanon {

std::vector<SvCaller> all_sv_callers()
{
    return {SvCaller::dragen_cnv, SvCaller::dragen_sv, SvCaller::delly2, SvCaller::manta, SvCaller::gatk_gcnv};
}

std::string to_string(const SvCaller caller)
{
    switch (caller) {
        case SvCaller::dragen_cnv: return "DRAGEN_CNV";
        case SvCaller::dragen_sv: return "DRAGEN_SV";
        case SvCaller::delly2: return "DELLY2";
        case SvCaller::manta: return "MANTA";
        case SvCaller::gatk_gcnv: return "GATK_GCNV";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, const SvCaller caller)
{
    os << to_string(caller);
    return os;
}

} // namespace varcanon
