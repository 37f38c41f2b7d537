// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sv_caller_hpp
#define sv_caller_hpp

#include <string>
#include <vector>
#include <iosfwd>

namespace varcanon {

// The structural variant callers whose VCF dialects are understood
enum class SvCaller { dragen_cnv, dragen_sv, delly2, manta, gatk_gcnv };

std::vector<SvCaller> all_sv_callers();

std::string to_string(SvCaller caller);

std::ostream& operator<<(std::ostream& os, SvCaller caller);

} // namespace varcanon

#endif
