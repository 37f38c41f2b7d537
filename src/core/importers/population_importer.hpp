// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef population_importer_hpp
#define population_importer_hpp

#include <vector>
#include <cstddef>
#include <functional>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "config/common.hpp"
#include "basics/genomic_region.hpp"
#include "io/variant/vcf_record.hpp"
#include "io/database/session.hpp"
#include "io/database/statement.hpp"
#include "core/types/population_record.hpp"
#include "core/tools/multi_allelic_extractor.hpp"
#include "core/tools/population_aggregator.hpp"
#include "population_source.hpp"

namespace varcanon {

/*
 Loads population VCFs into the source's table. The table is recreated on
 every run; all given files are appended to it.
 */
class PopulationImporter
{
public:
    using Path = boost::filesystem::path;
    
    PopulationImporter() = delete;
    
    PopulationImporter(database::Session& session, PopulationSource source,
                       const MultiAllelicExtractor& extractor, ReleaseName release);
    
    PopulationImporter(const PopulationImporter&)            = delete;
    PopulationImporter& operator=(const PopulationImporter&) = delete;
    
    ~PopulationImporter() = default;
    
    const PopulationSource& source() const noexcept;
    
    // Returns the number of rows written
    std::size_t run(const std::vector<Path>& vcfs, const boost::optional<GenomicRegion>& region = boost::none);
    
    // One record per alternative allele that can be stored
    std::vector<PopulationRecord> make_records(const VcfRecord& record) const;
    
private:
    std::reference_wrapper<database::Session> session_;
    PopulationSource source_;
    std::reference_wrapper<const MultiAllelicExtractor> extractor_;
    PopulationAggregator aggregator_;
    ReleaseName release_;
    std::size_t max_allele_length_;
};

// Binds in make_population_schema column order
void bind(const PopulationRecord& record, database::Statement& statement);

} // namespace varcanon

#endif
