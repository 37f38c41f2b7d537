// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "population_importer.hpp"

#include <utility>

#include "utils/string_utils.hpp"
#include "io/variant/vcf_reader.hpp"
#include "io/database/table_lifecycle.hpp"
#include "logging/logging.hpp"

namespace varcanon {

PopulationImporter::PopulationImporter(database::Session& session, PopulationSource source,
                                       const MultiAllelicExtractor& extractor, ReleaseName release)
: session_ {session}
, source_ {std::move(source)}
, extractor_ {extractor}
, aggregator_ {make_aggregator(source_)}
, release_ {std::move(release)}
, max_allele_length_ {extractor.max_allele_length()}
{}

const PopulationSource& PopulationImporter::source() const noexcept
{
    return source_;
}

std::vector<PopulationRecord> PopulationImporter::make_records(const VcfRecord& record) const
{
    std::vector<PopulationRecord> result {};
    for (auto& allele : extractor_.get().extract(record)) {
        PopulationRecord population_record {};
        population_record.release = release_;
        population_record.counts = aggregator_.zygosity_counts(record, allele.alt_index);
        population_record.af_popmax = aggregator_.popmax(record, allele.alt_index).value_or(0.0);
        population_record.variant = std::move(allele.variant);
        result.push_back(std::move(population_record));
    }
    return result;
}

std::size_t PopulationImporter::run(const std::vector<Path>& vcfs, const boost::optional<GenomicRegion>& region)
{
    std::vector<VcfReader> readers {};
    readers.reserve(vcfs.size());
    for (const auto& vcf : vcfs) {
        readers.emplace_back(vcf); // any missing file fails before the table is touched
    }
    logging::InfoLogger log {};
    database::TableLifecycle table {session_.get(), make_population_schema(source_, max_allele_length_)};
    table.recreate();
    stream(log) << "Importing " << source_.name << "...";
    std::size_t num_rows {0};
    database::Transaction transaction {session_.get()};
    for (const auto& reader : readers) {
        stream(log) << "Importing VCF " << reader.path().string();
        auto& upsert = table.populate();
        auto records = region ? reader.iterate(*region, VcfReader::UnpackPolicy::sites)
                              : reader.iterate(VcfReader::UnpackPolicy::sites);
        boost::optional<ContigName> prev_contig {};
        for (const auto& record : records) {
            if (!prev_contig || *prev_contig != record.chrom()) {
                stream(log) << "Now on chrom " << record.chrom();
                prev_contig = record.chrom();
            }
            for (const auto& population_record : make_records(record)) {
                bind(population_record, upsert);
                upsert.execute();
                upsert.reset();
                ++num_rows;
            }
        }
    }
    transaction.commit();
    table.index();
    stream(log) << "Done with importing " << source_.name << " (" << utils::format_with_commas(num_rows) << " rows)";
    return num_rows;
}

void bind(const PopulationRecord& record, database::Statement& statement)
{
    const auto& variant = record.variant;
    statement.bind(1, record.release)
             .bind(2, variant.contig())
             .bind(3, static_cast<long>(variant.pos()) + 1)
             .bind(4, static_cast<long>(variant.end()))
             .bind(5, variant.ref())
             .bind(6, variant.alt())
             .bind(7, record.counts.het)
             .bind(8, record.counts.hom)
             .bind(9, record.counts.hemi)
             .bind(10, record.af_popmax);
}

} // namespace varcanon
