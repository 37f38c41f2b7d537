// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef clinvar_importer_hpp
#define clinvar_importer_hpp

#include <string>
#include <vector>
#include <cstddef>
#include <functional>
#include <iosfwd>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "config/common.hpp"
#include "exceptions/user_error.hpp"
#include "io/database/session.hpp"
#include "io/database/statement.hpp"
#include "io/database/table_lifecycle.hpp"
#include "core/types/variant_key.hpp"
#include "core/tools/multi_allelic_extractor.hpp"

namespace varcanon {

struct ClinvarRecord
{
    ReleaseName release;
    VariantKey variant;
    std::string variation_id, clinical_significance, review_status;
};

bool operator==(const ClinvarRecord& lhs, const ClinvarRecord& rhs);
std::ostream& operator<<(std::ostream& os, const ClinvarRecord& record);

/*
 Loads MacArthur style ClinVar TSV files into clinvar_var. Every file header
 is checked before the table is recreated.
 */
class ClinvarImporter
{
public:
    using Path = boost::filesystem::path;
    using Row  = std::vector<std::string>;
    
    static const std::string table_name;
    
    ClinvarImporter() = delete;
    
    ClinvarImporter(database::Session& session, const MultiAllelicExtractor& extractor, ReleaseName release);
    
    ClinvarImporter(const ClinvarImporter&)            = delete;
    ClinvarImporter& operator=(const ClinvarImporter&) = delete;
    
    ~ClinvarImporter() = default;
    
    static const Row& expected_header();
    
    // Returns the number of rows written
    std::size_t run(const std::vector<Path>& tsvs);
    
    // Malformed rows and rows with overlong alleles give boost::none
    boost::optional<ClinvarRecord> make_record(const Row& row) const;
    
private:
    std::reference_wrapper<database::Session> session_;
    std::reference_wrapper<const MultiAllelicExtractor> extractor_;
    ReleaseName release_;
};

database::TableSchema make_clinvar_schema(std::size_t max_allele_length);

void bind(const ClinvarRecord& record, database::Statement& statement);

class UnexpectedTableHeader : public UserError
{
public:
    using Path = boost::filesystem::path;
    using Row  = std::vector<std::string>;
    
    UnexpectedTableHeader(Path file, Row found, Row expected);
    
    const Path& file() const noexcept;
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    Row found_, expected_;
};

} // namespace varcanon

#endif
