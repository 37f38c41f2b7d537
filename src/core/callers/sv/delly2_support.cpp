// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "delly2_support.hpp"

#include "io/variant/vcf_record.hpp"

namespace varcanon {

SvCaller Delly2Support::do_caller() const noexcept
{
    return SvCaller::delly2;
}

bool Delly2Support::do_is_compatible(const VcfHeader& header) const
{
    return has_info(header, "SVMETHOD") && has_format(header, "DV");
}

// Delly writes its version into INFO/SVMETHOD of every record, e.g. EMBL.DELLYv0.8.7
std::string Delly2Support::do_version(const VcfReader& reader) const
{
    for (const auto& record : reader.iterate(VcfReader::UnpackPolicy::sites)) {
        if (record.has_info("SVMETHOD") && !record.info_value("SVMETHOD").empty()) {
            return record.info_value("SVMETHOD").front();
        }
    }
    return "";
}

void Delly2Support::do_build_sample_genotype(const VcfRecord& record, const unsigned,
                                             const SampleName& sample, SampleGenotype::Builder& result) const
{
    result.set_genotype_quality(get_double(record, sample, "GQ"));
    const auto dr = get_int(record, sample, "DR"), dv = get_int(record, sample, "DV");
    if (dr && dv) result.set_paired_end_coverage(*dr + *dv);
    result.set_paired_end_variant_support(dv);
    const auto rr = get_int(record, sample, "RR"), rv = get_int(record, sample, "RV");
    if (rr && rv) result.set_split_read_coverage(*rr + *rv);
    result.set_split_read_variant_support(rv);
    result.set_copy_number(get_int(record, sample, "CN"));
}

} // namespace varcanon
