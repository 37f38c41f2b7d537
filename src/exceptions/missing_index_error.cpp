// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_index_error.hpp"

#include <utility>

namespace varcanon {

MissingIndexError::MissingIndexError(Path indexed_file, std::string kind)
: indexed_file_ {std::move(indexed_file)}
, kind_ {std::move(kind)}
{}

std::string MissingIndexError::do_where() const
{
    return "load_index";
}

std::string MissingIndexError::do_why() const
{
    return "there is no index for the " + kind_ + " file " + indexed_file_.string();
}

std::string MissingIndexError::do_help() const
{
    return kind_ == "fasta" ? "create one with 'samtools faidx'" : "create one with 'tabix -p vcf' or 'bcftools index'";
}

} // namespace varcanon
