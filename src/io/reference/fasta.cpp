// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "fasta.hpp"

#include <utility>
#include <algorithm>
#include <iterator>
#include <cctype>
#include <cstdlib>

#include <boost/filesystem/operations.hpp>

#include "exceptions/missing_file_error.hpp"
#include "exceptions/missing_index_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "exceptions/file_open_error.hpp"
#include "exceptions/program_error.hpp"

namespace varcanon { namespace io {

namespace {

class BadReferenceRequestRegion : public ProgramError
{
    GenomicRegion region_;
    
    std::string do_why() const override
    {
        return "requested bad reference region " + to_string(region_);
    }
    std::string do_where() const override
    {
        return "Fasta";
    }
public:
    BadReferenceRequestRegion(GenomicRegion region) : region_ {std::move(region)} {}
};

bool has_fasta_extension(Fasta::Path path)
{
    if (path.extension() == ".gz") path = path.stem();
    const auto extension = path.extension().string();
    return extension == ".fa" || extension == ".fasta" || extension == ".fna";
}

faidx_t* open_index(const Fasta::Path& fasta)
{
    // No flags, so htslib never tries to build a missing index
    auto result = fai_load3(fasta.c_str(), nullptr, nullptr, 0);
    if (result == nullptr) {
        throw FileOpenError {fasta, "fasta"};
    }
    return result;
}

} // namespace

void Fasta::FaidxDeleter::operator()(faidx_t* index) const
{
    fai_destroy(index);
}

Fasta::Fasta(Path fasta_path)
: path_ {std::move(fasta_path)}
, index_ {}
{
    using boost::filesystem::exists;
    if (!exists(path_)) {
        throw MissingFileError {path_, "fasta"};
    }
    if (!has_fasta_extension(path_)) {
        throw MalformedFileError {path_, "fasta", "expected a .fa, .fasta or .fna extension"};
    }
    if (!exists(path_.string() + ".fai")) {
        throw MissingIndexError {path_, "fasta"};
    }
    index_.reset(open_index(path_));
}

Fasta::Fasta(const Fasta& other)
: path_ {other.path_}
, index_ {open_index(other.path_)}
{}

Fasta& Fasta::operator=(Fasta other)
{
    using std::swap;
    swap(path_, other.path_);
    swap(index_, other.index_);
    return *this;
}

std::unique_ptr<ReferenceReader> Fasta::do_clone() const
{
    return std::make_unique<Fasta>(*this);
}

std::string Fasta::do_name() const
{
    return path_.stem().string();
}

std::vector<Fasta::Contig> Fasta::do_fetch_contigs() const
{
    const auto num_contigs = faidx_nseq(index_.get());
    std::vector<Contig> result {};
    result.reserve(num_contigs);
    for (int i {0}; i < num_contigs; ++i) {
        const char* name {faidx_iseq(index_.get(), i)};
        const auto length = faidx_seq_len(index_.get(), name);
        if (length < 0) throw BadReferenceRequestRegion {GenomicRegion {name, 0, 0}};
        result.push_back({name, static_cast<GenomicSize>(length)});
    }
    return result;
}

Fasta::GeneticSequence Fasta::do_fetch_sequence(const GenomicRegion& region) const
{
    if (is_empty(region)) return {};
    int length {0};
    // faidx coordinates are zero-based closed
    char* bases {faidx_fetch_seq(index_.get(), region.contig_name().c_str(),
                                 static_cast<int>(region.begin()), static_cast<int>(region.end() - 1),
                                 &length)};
    if (bases == nullptr) {
        throw BadReferenceRequestRegion {region};
    }
    GeneticSequence result {bases, bases + std::max(length, 0)};
    std::free(bases);
    if (result.size() < size(region)) {
        throw BadReferenceRequestRegion {region};
    }
    std::transform(std::cbegin(result), std::cend(result), std::begin(result),
                   [] (char base) { return std::toupper(base); });
    return result;
}

} // namespace io
} // namespace varcanon
