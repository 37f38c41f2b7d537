// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "maelstrom_coverage_reader.hpp"

#include <utility>
#include <algorithm>
#include <iterator>

#include <boost/lexical_cast.hpp>

#include "exceptions/malformed_file_error.hpp"
#include "io/variant/vcf_reader.hpp"
#include "io/variant/vcf_header.hpp"
#include "io/variant/vcf_record.hpp"
#include "io/variant/vcf_spec.hpp"
#include "logging/logging.hpp"

namespace varcanon {

namespace {

class RunningMean
{
public:
    void add(const double value) noexcept { sum_ += value; ++count_; }
    boost::optional<double> get() const noexcept
    {
        if (count_ == 0) return boost::none;
        return sum_ / count_;
    }
private:
    double sum_ = 0;
    unsigned count_ = 0;
};

boost::optional<double>
read_value(const VcfRecord& record, const SampleName& sample, const std::string& key)
{
    if (!record.has_sample_value(sample, key)) return boost::none;
    const auto& values = record.get_sample_value(sample, key);
    if (values.empty() || values.front() == vcfspec::missingValue) return boost::none;
    try {
        return boost::lexical_cast<double>(values.front());
    } catch (const boost::bad_lexical_cast&) {
        logging::WarningLogger log {};
        stream(log) << "Ignoring non-numeric " << key << " value '" << values.front() << "' at "
                    << record.chrom() << ':' << record.pos();
        return boost::none;
    }
}

} // namespace

MaelstromCoverageReader::MaelstromCoverageReader(Path coverage_vcf)
: sample_ {}
, windows_ {}
{
    load(coverage_vcf);
}

const SampleName& MaelstromCoverageReader::sample() const noexcept
{
    return sample_;
}

std::size_t MaelstromCoverageReader::num_windows() const noexcept
{
    std::size_t result {0};
    for (const auto& p : windows_) result += p.second.windows.size();
    return result;
}

void MaelstromCoverageReader::load(const Path& coverage_vcf)
{
    const VcfReader reader {coverage_vcf};
    const auto header = reader.fetch_header();
    if (header.num_samples() != 1) {
        throw MalformedFileError {reader.path(), "vcf", "a coverage VCF must contain exactly one sample"};
    }
    sample_ = header.samples().front();
    for (const auto& record : reader.iterate(VcfReader::UnpackPolicy::all)) {
        auto& contig = windows_[record.chrom()];
        contig.windows.push_back({record.mapped_region(),
                                  read_value(record, sample_, "CV"),
                                  read_value(record, sample_, "MQ")});
        contig.max_window_size = std::max(contig.max_window_size, size(record.mapped_region()));
    }
    for (auto& p : windows_) {
        std::stable_sort(std::begin(p.second.windows), std::end(p.second.windows),
                         [] (const Window& lhs, const Window& rhs) {
                             return lhs.region.begin() < rhs.region.begin();
                         });
    }
}

CoverageSummary MaelstromCoverageReader::do_fetch(const GenomicRegion& region) const
{
    RunningMean coverage {}, mapping_quality {};
    const auto contig = windows_.find(region.contig_name());
    if (contig == std::cend(windows_)) return CoverageSummary {};
    const auto& windows = contig->second.windows;
    const auto max_size = contig->second.max_window_size;
    const GenomicRegion::Position first_begin {region.begin() > max_size ? region.begin() - max_size : 0};
    auto it = std::lower_bound(std::cbegin(windows), std::cend(windows), first_begin,
                               [] (const Window& window, const GenomicRegion::Position pos) {
                                   return window.region.begin() < pos;
                               });
    for (; it != std::cend(windows) && it->region.begin() <= region.end(); ++it) {
        if (!overlaps(it->region, region)) continue;
        if (it->normalized_coverage) coverage.add(*it->normalized_coverage);
        if (it->mapping_quality) mapping_quality.add(*it->mapping_quality);
    }
    return CoverageSummary {coverage.get(), mapping_quality.get()};
}

} // namespace varcanon
