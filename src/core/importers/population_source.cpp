// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "population_source.hpp"

#include <utility>

namespace varcanon {

PopulationSource exac_source()
{
    // AC_Hom is only read from the combined field, never per population
    return {"ExAC", "exac_var", {std::string {"AC_Het"}, std::string {"AC_Hom"}, std::string {"AC_Hemi"}},
            {"AFR", "AMR", "EAS", "FIN", "NFE", "OTH", "SAS"}};
}

namespace {

PopulationSource gnomad_source(std::string name, std::string table_name)
{
    return {std::move(name), std::move(table_name), {boost::none, std::string {"Hom"}, std::string {"Hemi"}},
            {"AFR", "AMR", "ASJ", "EAS", "FIN", "NFE", "OTH", "SAS"}};
}

} // namespace

PopulationSource gnomad_exomes_source()
{
    return gnomad_source("gnomAD exomes", "gnomad_exome_var");
}

PopulationSource gnomad_genomes_source()
{
    return gnomad_source("gnomAD genomes", "gnomad_genome_var");
}

PopulationSource thousand_genomes_source()
{
    return {"1000 Genomes", "thousand_genomes_var", {std::string {"Het"}, std::string {"Hom"}, std::string {"Hemi"}},
            {"AFR", "AMR", "ASN", "EUR"}};
}

PopulationAggregator make_aggregator(const PopulationSource& source)
{
    return PopulationAggregator {source.populations, source.zygosity_fields};
}

database::TableSchema make_population_schema(const PopulationSource& source, const std::size_t max_allele_length)
{
    const auto allele_type = "VARCHAR(" + std::to_string(max_allele_length) + ") NOT NULL";
    return {
        source.table_name,
        {
            {"release", "VARCHAR(10) NOT NULL"},
            {"chrom", "VARCHAR(20) NOT NULL"},
            {"start", "INTEGER NOT NULL"},
            {"end", "INTEGER NOT NULL"},
            {"ref", allele_type},
            {"alt", allele_type},
            {"het", "INTEGER NOT NULL"},
            {"hom", "INTEGER NOT NULL"},
            {"hemi", "INTEGER NOT NULL"},
            {"af_popmax", "DOUBLE NOT NULL"}
        },
        {"release", "chrom", "start", "ref", "alt"},
        {"release", "chrom", "start", "end"}
    };
}

} // namespace varcanon
