// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "init_db.hpp"

#include "io/database/session.hpp"
#include "core/tools/variant_normaliser.hpp"
#include "core/tools/multi_allelic_extractor.hpp"
#include "core/importers/population_importer.hpp"
#include "core/importers/clinvar_importer.hpp"
#include "logging/logging.hpp"

namespace varcanon {

void run_init_db(InitDbComponents& components)
{
    logging::InfoLogger log {};
    stream(log) << "Opening database " << components.database.string();
    database::Session session {components.database};
    const VariantNormaliser normaliser {components.reference};
    const MultiAllelicExtractor extractor {normaliser, components.max_allele_length};
    for (auto& population : components.populations) {
        PopulationImporter importer {session, population.source, extractor, components.release};
        importer.run(population.vcfs, components.region);
    }
    if (!components.clinvar.empty()) {
        ClinvarImporter importer {session, extractor, components.release};
        importer.run(components.clinvar);
    }
    stream(log) << "Database " << components.database.string() << " is up to date";
}

} // namespace varcanon
