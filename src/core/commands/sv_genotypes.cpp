// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sv_genotypes.hpp"

#include <vector>
#include <string>
#include <ostream>
#include <fstream>
#include <utility>

#include "utils/string_utils.hpp"
#include "core/callers/sv/sv_caller_registry.hpp"
#include "exceptions/system_error.hpp"
#include "logging/logging.hpp"

namespace varcanon {

std::size_t write_sample_genotypes(const VcfReader& reader, const CallerSupport& support, std::ostream& out)
{
    std::vector<std::string> header {"chrom", "pos", "end", "alt_index"};
    const auto genotype_fields = sample_genotype_field_names();
    header.insert(header.cend(), genotype_fields.cbegin(), genotype_fields.cend());
    out << utils::join(header, '\t') << '\n';
    const auto samples = reader.fetch_header().samples();
    std::size_t num_lines {0};
    for (const auto& record : reader.iterate()) {
        for (unsigned alt_index {1}; alt_index <= record.num_alt(); ++alt_index) {
            for (const auto& sample : samples) {
                const auto genotype = support.build_sample_genotype(record, alt_index, sample);
                out << record.chrom() << '\t' << record.pos() << '\t' << record.mapped_region().end()
                    << '\t' << alt_index << '\t' << utils::join(to_fields(genotype), '\t') << '\n';
                ++num_lines;
            }
        }
    }
    return num_lines;
}

namespace {

class OutputFileError : public SystemError
{
public:
    OutputFileError(boost::filesystem::path file) : file_ {std::move(file)} {}
    
private:
    std::string do_where() const override
    {
        return "run_sv_genotypes";
    }
    
    std::string do_why() const override
    {
        return "Could not write to the output file " + file_.string();
    }
    
    std::string do_help() const override
    {
        return "check the output directory exists and is writable";
    }
    
    boost::filesystem::path file_;
};

} // namespace

void run_sv_genotypes(const SvGenotypesComponents& components)
{
    const VcfReader reader {components.sv_path};
    const auto registry = make_sv_caller_registry(components.coverage);
    const auto& support = registry.detect(reader.fetch_header(), components.sv_path);
    logging::InfoLogger log {};
    stream(log) << "Detected " << support.caller() << " version " << support.version(reader)
                << " in " << components.sv_path.string();
    std::ofstream out {components.output.string()};
    if (!out) {
        throw OutputFileError {components.output};
    }
    const auto num_lines = write_sample_genotypes(reader, support, out);
    out.flush();
    if (!out) {
        throw OutputFileError {components.output};
    }
    stream(log) << "Wrote " << utils::format_with_commas(num_lines) << " sample genotypes to "
                << components.output.string();
}

} // namespace varcanon
