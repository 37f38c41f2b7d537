// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "test_common.hpp"
#include "io/reference/reference_genome.hpp"
#include "io/database/session.hpp"
#include "core/tools/variant_normaliser.hpp"
#include "core/tools/multi_allelic_extractor.hpp"
#include "core/importers/clinvar_importer.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(importers)
BOOST_AUTO_TEST_SUITE(clinvar_importer)

namespace {

ClinvarImporter::Row make_row(std::string chrom, std::string pos, std::string ref, std::string alt)
{
    ClinvarImporter::Row result(ClinvarImporter::expected_header().size());
    result[0] = std::move(chrom);
    result[1] = std::move(pos);
    result[2] = std::move(ref);
    result[3] = std::move(alt);
    result[8] = "42";
    result[16] = "Likely benign";
    result[23] = "no assertion criteria provided";
    return result;
}

long count_rows(database::Session& session)
{
    auto query = session.prepare("SELECT COUNT(*) FROM " + ClinvarImporter::table_name);
    BOOST_REQUIRE(query.step());
    return query.column_long(0);
}

} // namespace

BOOST_AUTO_TEST_CASE(rows_are_normalised_like_population_records)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    TemporaryFile db {};
    database::Session session {db.path()};
    const ClinvarImporter importer {session, extractor, "GRCh37"};
    const auto record = importer.make_record(make_row("chr1", "5", "T", "TT"));
    BOOST_REQUIRE(record);
    BOOST_CHECK_EQUAL(record->release, "GRCh37");
    BOOST_CHECK_EQUAL(record->variant, (VariantKey {"chr1", 2, "G", "GT"}));
    BOOST_CHECK_EQUAL(record->variation_id, "42");
    BOOST_CHECK_EQUAL(record->clinical_significance, "Likely benign");
    BOOST_CHECK_EQUAL(record->review_status, "no assertion criteria provided");
}

BOOST_AUTO_TEST_CASE(malformed_rows_are_skipped)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    TemporaryFile db {};
    database::Session session {db.path()};
    const ClinvarImporter importer {session, extractor, "GRCh37"};
    BOOST_CHECK(!importer.make_record(make_row("chr1", "abc", "T", "G")));
    BOOST_CHECK(!importer.make_record(make_row("chr1", "0", "T", "G")));
    BOOST_CHECK(!importer.make_record(make_row("chr1", "-1", "T", "G")));
    BOOST_CHECK(!importer.make_record(make_row("chr1", "-1", "T", "TT")));
    BOOST_CHECK(!importer.make_record(make_row("chr1", "4294967296", "T", "G")));
    BOOST_CHECK(!importer.make_record(ClinvarImporter::Row {"chr1", "5", "T", "G"}));
}

BOOST_AUTO_TEST_CASE(tsv_files_are_imported_into_one_table)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    TemporaryFile db {};
    database::Session session {db.path()};
    ClinvarImporter importer {session, extractor, "GRCh37"};
    BOOST_CHECK_EQUAL(importer.run({clinvar_tsv}), 3);
    BOOST_CHECK_EQUAL(count_rows(session), 3);
    auto query = session.prepare("SELECT start, end, ref, alt, variation_id, clinical_significance, review_status"
                                 " FROM clinvar_var WHERE release = 'GRCh37' AND chrom = 'chr1' ORDER BY start");
    BOOST_REQUIRE(query.step());
    BOOST_CHECK_EQUAL(query.column_long(0), 3);
    BOOST_CHECK_EQUAL(query.column_long(1), 3);
    BOOST_CHECK_EQUAL(query.column_text(2), "G");
    BOOST_CHECK_EQUAL(query.column_text(3), "GT");
    BOOST_CHECK_EQUAL(query.column_text(4), "1001");
    BOOST_CHECK_EQUAL(query.column_text(5), "Pathogenic");
    BOOST_CHECK_EQUAL(query.column_text(6), "criteria provided, single submitter");
    BOOST_REQUIRE(query.step());
    BOOST_CHECK_EQUAL(query.column_long(0), 24);
    BOOST_CHECK_EQUAL(query.column_text(3), "ATTTTTTTTT");
    BOOST_CHECK(!query.step());
}

BOOST_AUTO_TEST_CASE(duplicate_rows_across_files_are_upserted)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    TemporaryFile db {};
    database::Session session {db.path()};
    ClinvarImporter importer {session, extractor, "GRCh37"};
    BOOST_CHECK_EQUAL(importer.run({clinvar_tsv, resource("clinvar.tsv.gz")}), 6);
    BOOST_CHECK_EQUAL(count_rows(session), 3);
}

BOOST_AUTO_TEST_CASE(overlong_alleles_are_skipped)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 5};
    TemporaryFile db {};
    database::Session session {db.path()};
    ClinvarImporter importer {session, extractor, "GRCh37"};
    BOOST_CHECK_EQUAL(importer.run({clinvar_tsv}), 2);
}

BOOST_AUTO_TEST_CASE(unexpected_headers_abort_before_any_row_is_written)
{
    const auto reference = make_reference(reference_fasta);
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    TemporaryFile db {};
    database::Session session {db.path()};
    {
        ClinvarImporter importer {session, extractor, "GRCh37"};
        importer.run({clinvar_tsv});
    }
    ClinvarImporter importer {session, extractor, "GRCh37"};
    try {
        importer.run({clinvar_tsv, bad_header_clinvar_tsv});
        BOOST_FAIL("expected UnexpectedTableHeader");
    } catch (const UnexpectedTableHeader& e) {
        BOOST_CHECK_EQUAL(e.file(), bad_header_clinvar_tsv);
    }
    BOOST_CHECK_EQUAL(count_rows(session), 3);
}

BOOST_AUTO_TEST_CASE(the_schema_matches_the_population_tables)
{
    const auto schema = make_clinvar_schema(500);
    BOOST_CHECK_EQUAL(schema.name, "clinvar_var");
    BOOST_CHECK_EQUAL(schema.columns.size(), 9);
    const std::vector<std::string> key {"release", "chrom", "start", "ref", "alt"};
    BOOST_CHECK(schema.primary_key == key);
    const std::vector<std::string> index {"release", "chrom", "start", "end"};
    BOOST_CHECK(schema.index == index);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
