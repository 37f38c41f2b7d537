// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "clinvar_importer.hpp"

#include <utility>
#include <ostream>
#include <sstream>
#include <tuple>
#include <limits>

#include <boost/lexical_cast.hpp>

#include "utils/string_utils.hpp"
#include "io/tsv/tsv_reader.hpp"
#include "logging/logging.hpp"

namespace varcanon {

namespace {

namespace column {

constexpr std::size_t chrom {0}, pos {1}, ref {2}, alt {3};
constexpr std::size_t variation_id {8}, clinical_significance {16}, review_status {23};

} // namespace column

} // namespace

bool operator==(const ClinvarRecord& lhs, const ClinvarRecord& rhs)
{
    return std::tie(lhs.release, lhs.variant, lhs.variation_id, lhs.clinical_significance, lhs.review_status)
        == std::tie(rhs.release, rhs.variant, rhs.variation_id, rhs.clinical_significance, rhs.review_status);
}

std::ostream& operator<<(std::ostream& os, const ClinvarRecord& record)
{
    os << record.release << ' ' << record.variant << ' ' << record.variation_id << ' '
       << record.clinical_significance << ' ' << record.review_status;
    return os;
}

const std::string ClinvarImporter::table_name {"clinvar_var"};

ClinvarImporter::ClinvarImporter(database::Session& session, const MultiAllelicExtractor& extractor,
                                 ReleaseName release)
: session_ {session}
, extractor_ {extractor}
, release_ {std::move(release)}
{}

const ClinvarImporter::Row& ClinvarImporter::expected_header()
{
    static const Row result {
        "chrom", "pos", "ref", "alt", "start", "stop", "strand", "variation_type", "variation_id",
        "rcv", "scv", "allele_id", "symbol", "hgvs_c", "hgvs_p", "molecular_consequence",
        "clinical_significance", "clinical_significance_ordered", "pathogenic", "likely_pathogenic",
        "uncertain_significance", "likely_benign", "benign", "review_status", "review_status_ordered",
        "last_evaluated", "all_submitters", "submitters_ordered", "all_traits", "all_pmids",
        "inheritance_modes", "age_of_onset", "prevalence", "disease_mechanism", "origin", "xrefs",
        "dates_ordered"
    };
    return result;
}

boost::optional<ClinvarRecord> ClinvarImporter::make_record(const Row& row) const
{
    if (row.size() != expected_header().size()) {
        logging::WarningLogger log {};
        stream(log) << "Skipping ClinVar row with " << row.size() << " fields (expected "
                    << expected_header().size() << ")";
        return boost::none;
    }
    long long one_based_pos;
    try {
        one_based_pos = boost::lexical_cast<long long>(row[column::pos]);
    } catch (const boost::bad_lexical_cast&) {
        logging::WarningLogger log {};
        stream(log) << "Skipping ClinVar row with bad position '" << row[column::pos] << "'";
        return boost::none;
    }
    constexpr auto max_pos = static_cast<long long>(std::numeric_limits<VariantKey::Position>::max());
    if (one_based_pos <= 0 || one_based_pos > max_pos) {
        logging::WarningLogger log {};
        stream(log) << "Skipping ClinVar row at " << row[column::chrom] << ':' << row[column::pos]
                    << " as the position is out of range";
        return boost::none;
    }
    const auto pos = static_cast<VariantKey::Position>(one_based_pos);
    const VariantKey raw {row[column::chrom], pos - 1, row[column::ref], row[column::alt]};
    auto variant = extractor_.get().extract(raw);
    if (!variant) return boost::none;
    return ClinvarRecord {release_, std::move(*variant), row[column::variation_id],
                          row[column::clinical_significance], row[column::review_status]};
}

std::size_t ClinvarImporter::run(const std::vector<Path>& tsvs)
{
    std::vector<io::TsvReader> readers {};
    readers.reserve(tsvs.size());
    for (const auto& tsv : tsvs) {
        readers.emplace_back(tsv);
        if (readers.back().header() != expected_header()) {
            throw UnexpectedTableHeader {tsv, readers.back().header(), expected_header()};
        }
    }
    logging::InfoLogger log {};
    database::TableLifecycle table {session_.get(), make_clinvar_schema(extractor_.get().max_allele_length())};
    table.recreate();
    log << "Importing ClinVar...";
    std::size_t num_rows {0};
    database::Transaction transaction {session_.get()};
    for (auto& reader : readers) {
        stream(log) << "Importing TSV " << reader.path().string();
        auto& upsert = table.populate();
        Row row {};
        while (reader.read(row)) {
            const auto record = make_record(row);
            if (record) {
                bind(*record, upsert);
                upsert.execute();
                upsert.reset();
                ++num_rows;
            }
        }
    }
    transaction.commit();
    table.index();
    stream(log) << "Done with importing ClinVar (" << utils::format_with_commas(num_rows) << " rows)";
    return num_rows;
}

database::TableSchema make_clinvar_schema(const std::size_t max_allele_length)
{
    const auto allele_type = "VARCHAR(" + std::to_string(max_allele_length) + ") NOT NULL";
    return {
        ClinvarImporter::table_name,
        {
            {"release", "VARCHAR(10) NOT NULL"},
            {"chrom", "VARCHAR(20) NOT NULL"},
            {"start", "INTEGER NOT NULL"},
            {"end", "INTEGER NOT NULL"},
            {"ref", allele_type},
            {"alt", allele_type},
            {"variation_id", "VARCHAR(20) NOT NULL"},
            {"clinical_significance", "TEXT NOT NULL"},
            {"review_status", "TEXT NOT NULL"}
        },
        {"release", "chrom", "start", "ref", "alt"},
        {"release", "chrom", "start", "end"}
    };
}

void bind(const ClinvarRecord& record, database::Statement& statement)
{
    const auto& variant = record.variant;
    statement.bind(1, record.release)
             .bind(2, variant.contig())
             .bind(3, static_cast<long>(variant.pos()) + 1)
             .bind(4, static_cast<long>(variant.end()))
             .bind(5, variant.ref())
             .bind(6, variant.alt())
             .bind(7, record.variation_id)
             .bind(8, record.clinical_significance)
             .bind(9, record.review_status);
}

// UnexpectedTableHeader

UnexpectedTableHeader::UnexpectedTableHeader(Path file, Row found, Row expected)
: file_ {std::move(file)}
, found_ {std::move(found)}
, expected_ {std::move(expected)}
{}

const UnexpectedTableHeader::Path& UnexpectedTableHeader::file() const noexcept
{
    return file_;
}

std::string UnexpectedTableHeader::do_where() const
{
    return "ClinvarImporter::run";
}

std::string UnexpectedTableHeader::do_why() const
{
    std::ostringstream ss {};
    ss << "The header of " << file_ << " is [" << utils::join(found_, ", ")
       << "] but [" << utils::join(expected_, ", ") << "] was expected";
    return ss.str();
}

std::string UnexpectedTableHeader::do_help() const
{
    return "use the ClinVar TSV files from the MacArthur lab clinvar repository";
}

} // namespace varcanon
