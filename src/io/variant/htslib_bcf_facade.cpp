// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "htslib_bcf_facade.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>

#include "htslib/hts.h"

#include "basics/genomic_region.hpp"
#include "utils/string_utils.hpp"
#include "exceptions/missing_file_error.hpp"
#include "exceptions/missing_index_error.hpp"
#include "exceptions/malformed_file_error.hpp"
#include "exceptions/file_open_error.hpp"
#include "vcf_spec.hpp"
#include "vcf_header.hpp"
#include "vcf_record.hpp"

namespace varcanon {

namespace {

// Scratch space htslib grows with realloc
template <typename T>
struct HtsBuffer
{
    T* data = nullptr;
    int capacity = 0;
    
    HtsBuffer() = default;
    HtsBuffer(const HtsBuffer&)            = delete;
    HtsBuffer& operator=(const HtsBuffer&) = delete;
    ~HtsBuffer() { std::free(data); }
};

// bcf_get_format_string packs all samples into the first allocation
struct HtsStringArray
{
    char** data = nullptr;
    int capacity = 0;
    
    HtsStringArray() = default;
    HtsStringArray(const HtsStringArray&)            = delete;
    HtsStringArray& operator=(const HtsStringArray&) = delete;
    ~HtsStringArray()
    {
        if (data) std::free(data[0]);
        std::free(data);
    }
};

struct FileCloser
{
    void operator()(htsFile* file) const { hts_close(file); }
};

std::string format_value(const std::int32_t value)
{
    return value == bcf_int32_missing ? vcfspec::missingValue : std::to_string(value);
}

std::string format_value(const float value)
{
    if (bcf_float_is_missing(value) || std::isnan(value)) return vcfspec::missingValue;
    return boost::lexical_cast<std::string>(value);
}

bool is_vector_end(const std::int32_t value) noexcept
{
    return value == bcf_int32_vector_end;
}

bool is_vector_end(const float value) noexcept
{
    return bcf_float_is_vector_end(value);
}

template <typename T>
VcfRecord::Values format_values(const T* first, const T* last)
{
    VcfRecord::Values result {};
    for (; first != last && !is_vector_end(*first); ++first) {
        result.push_back(format_value(*first));
    }
    return result;
}

VcfRecord::Values split_values(const char* first, const std::size_t max_chars)
{
    const auto length = ::strnlen(first, max_chars);
    return utils::split(std::string {first, length}, vcfspec::info::valueSeperator);
}

int get_info(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<std::int32_t>& buffer)
{
    return bcf_get_info_int32(header, line, key, &buffer.data, &buffer.capacity);
}

int get_info(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<float>& buffer)
{
    return bcf_get_info_float(header, line, key, &buffer.data, &buffer.capacity);
}

int get_format(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<std::int32_t>& buffer)
{
    return bcf_get_format_int32(header, line, key, &buffer.data, &buffer.capacity);
}

int get_format(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<float>& buffer)
{
    return bcf_get_format_float(header, line, key, &buffer.data, &buffer.capacity);
}

template <typename T>
VcfRecord::Values read_info(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<T>& buffer)
{
    const auto n = get_info(header, line, key, buffer);
    if (n <= 0) return {};
    return format_values(buffer.data, buffer.data + n);
}

VcfRecord::Values read_info(const bcf_hdr_t* header, bcf1_t* line, const char* key, HtsBuffer<char>& buffer)
{
    const auto n = bcf_get_info_string(header, line, key, &buffer.data, &buffer.capacity);
    if (n <= 0) return {};
    return split_values(buffer.data, static_cast<std::size_t>(n));
}

template <typename T>
std::vector<VcfRecord::Values>
read_format(const bcf_hdr_t* header, bcf1_t* line, const char* key, const int num_samples, HtsBuffer<T>& buffer)
{
    std::vector<VcfRecord::Values> result(num_samples);
    const auto n = get_format(header, line, key, buffer);
    if (n > 0) {
        const auto stride = n / num_samples;
        for (int s {0}; s < num_samples; ++s) {
            const auto first = buffer.data + s * stride;
            result[s] = format_values(first, first + stride);
        }
    }
    return result;
}

std::vector<VcfRecord::Values>
read_format(const bcf_hdr_t* header, bcf1_t* line, const char* key, const int num_samples, HtsStringArray& buffer)
{
    std::vector<VcfRecord::Values> result(num_samples);
    const auto n = bcf_get_format_string(header, line, key, &buffer.data, &buffer.capacity);
    if (n > 0) {
        const auto width = static_cast<std::size_t>(n / num_samples);
        for (int s {0}; s < num_samples; ++s) {
            result[s] = split_values(buffer.data[s], width);
        }
    }
    return result;
}

struct ValueBuffers
{
    HtsBuffer<std::int32_t> ints;
    HtsBuffer<float> floats;
    HtsBuffer<char> chars;
    HtsStringArray strings;
};

const char* key_name(const bcf_hdr_t* header, const int key_id) noexcept
{
    if (key_id < 0 || key_id >= header->n[BCF_DT_ID]) return nullptr;
    return header->id[BCF_DT_ID][key_id].key;
}

void decode_info(const bcf_hdr_t* header, bcf1_t* line, ValueBuffers& buffers, VcfRecord::Builder& builder)
{
    for (std::uint32_t i {0}; i < line->n_info; ++i) {
        const auto key_id = line->d.info[i].key;
        const auto key = key_name(header, key_id);
        if (!key) throw std::out_of_range {"INFO key is not declared in the header"};
        switch (bcf_hdr_id2type(header, BCF_HL_INFO, key_id)) {
            case BCF_HT_FLAG:
                builder.set_info(key, "1");
                break;
            case BCF_HT_INT:
                builder.set_info(key, read_info(header, line, key, buffers.ints));
                break;
            case BCF_HT_REAL:
                builder.set_info(key, read_info(header, line, key, buffers.floats));
                break;
            default:
                builder.set_info(key, read_info(header, line, key, buffers.chars));
        }
    }
}

void decode_genotypes(const bcf_hdr_t* header, bcf1_t* line, VcfRecord::Builder& builder)
{
    using Phasing = VcfRecord::Builder::Phasing;
    const int num_samples {bcf_hdr_nsamples(header)};
    HtsBuffer<std::int32_t> buffer {};
    const auto n = bcf_get_genotypes(header, line, &buffer.data, &buffer.capacity);
    if (n <= 0) return;
    const auto ploidy = n / num_samples;
    for (int s {0}; s < num_samples; ++s) {
        const auto first = buffer.data + s * ploidy;
        std::vector<VcfRecord::AlleleIndex> alleles {};
        bool phased {false};
        for (auto itr = first; itr != first + ploidy && !is_vector_end(*itr); ++itr) {
            if (itr != first && bcf_gt_is_phased(*itr)) phased = true;
            const auto allele = bcf_gt_allele(*itr);
            if (bcf_gt_is_missing(*itr) || allele >= line->n_allele) {
                alleles.push_back(boost::none);
            } else {
                alleles.emplace_back(static_cast<unsigned>(allele));
            }
        }
        builder.set_genotype(header->samples[s], std::move(alleles), phased ? Phasing::phased : Phasing::unphased);
    }
}

void decode_samples(const bcf_hdr_t* header, bcf1_t* line, ValueBuffers& buffers, VcfRecord::Builder& builder)
{
    const int num_samples {bcf_hdr_nsamples(header)};
    if (num_samples == 0 || line->n_fmt == 0) return;
    std::vector<VcfRecord::KeyType> keys {};
    keys.reserve(line->n_fmt);
    for (std::uint32_t i {0}; i < line->n_fmt; ++i) {
        const auto key_id = line->d.fmt[i].id;
        const auto key = key_name(header, key_id);
        if (!key) throw std::out_of_range {"FORMAT key is not declared in the header"};
        keys.emplace_back(key);
        if (keys.back() == vcfspec::format::genotype) {
            decode_genotypes(header, line, builder);
            continue;
        }
        std::vector<VcfRecord::Values> values {};
        switch (bcf_hdr_id2type(header, BCF_HL_FMT, key_id)) {
            case BCF_HT_INT:
                values = read_format(header, line, key, num_samples, buffers.ints);
                break;
            case BCF_HT_REAL:
                values = read_format(header, line, key, num_samples, buffers.floats);
                break;
            default:
                values = read_format(header, line, key, num_samples, buffers.strings);
        }
        for (int s {0}; s < num_samples; ++s) {
            builder.set_format(header->samples[s], key, std::move(values[s]));
        }
    }
    builder.set_format(std::move(keys));
}

VcfRecord decode(const bcf_hdr_t* header, bcf1_t* line, const IVcfReaderImpl::UnpackPolicy level)
{
    const auto with_samples = level == IVcfReaderImpl::UnpackPolicy::all;
    bcf_unpack(line, with_samples ? BCF_UN_ALL : BCF_UN_SHR);
    VcfRecord::Builder builder {};
    builder.set_chrom(bcf_hdr_id2name(header, line->rid))
           .set_pos(static_cast<GenomicRegion::Position>(line->pos) + 1)
           .set_end(static_cast<GenomicRegion::Position>(line->pos + line->rlen))
           .set_ref(line->d.allele[0])
           .set_alt(std::vector<VcfRecord::NucleotideSequence> {line->d.allele + 1, line->d.allele + line->n_allele});
    ValueBuffers buffers {};
    decode_info(header, line, buffers, builder);
    if (with_samples) decode_samples(header, line, buffers, builder);
    return builder.build_once();
}

std::string unquote(std::string value)
{
    if (value.size() > 1 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

VcfHeader::StructuredField to_structured_field(const bcf_hrec_t& line)
{
    VcfHeader::StructuredField result {};
    for (int k {0}; k < line.nkeys; ++k) {
        if (std::strcmp(line.keys[k], "IDX") != 0) { // added by htslib
            result.emplace(line.keys[k], unquote(line.vals[k]));
        }
    }
    return result;
}

} // namespace

class HtslibBcfFacade::Cursor : public IVcfReaderImpl::RecordCursor
{
public:
    Cursor(const HtslibBcfFacade& facade, SyncedReaderPtr reader, UnpackPolicy level,
           boost::optional<GenomicRegion> filter = boost::none)
    : facade_ {facade}
    , reader_ {std::move(reader)}
    , level_ {level}
    , filter_ {std::move(filter)}
    {}
    
    bool advance() override
    {
        while (bcf_sr_next_line(reader_.get())) {
            try {
                record_ = decode(bcf_sr_get_header(reader_.get(), 0), bcf_sr_get_line(reader_.get(), 0), level_);
            } catch (const std::out_of_range& e) {
                throw MalformedFileError {facade_.file_path_, "vcf", e.what()};
            }
            if (!filter_ || overlaps(record_.mapped_region(), *filter_)) return true;
        }
        return false;
    }
    
    const VcfRecord& record() const noexcept override { return record_; }
    
private:
    const HtslibBcfFacade& facade_;
    SyncedReaderPtr reader_;
    UnpackPolicy level_;
    boost::optional<GenomicRegion> filter_;
    VcfRecord record_;
};

HtslibBcfFacade::HtslibBcfFacade(Path file_path)
: file_path_ {std::move(file_path)}
{
    if (!boost::filesystem::exists(file_path_)) {
        throw MissingFileError {file_path_, "vcf"};
    }
    const std::unique_ptr<htsFile, FileCloser> file {bcf_open(file_path_.c_str(), "r")};
    if (!file) {
        throw FileOpenError {file_path_, "vcf", std::make_error_code(static_cast<std::errc>(errno))};
    }
    header_.reset(bcf_hdr_read(file.get()));
    if (!header_) {
        throw MalformedFileError {file_path_, "vcf", "the header could not be parsed"};
    }
}

VcfHeader HtslibBcfFacade::fetch_header() const
{
    VcfHeader::Builder result {};
    const auto num_samples = bcf_hdr_nsamples(header_.get());
    result.set_samples({header_->samples, header_->samples + num_samples});
    for (int i {0}; i < header_->nhrec; ++i) {
        const auto& line = *header_->hrec[i];
        if (line.type == BCF_HL_GEN) {
            result.add_basic_field(line.key, line.value);
        } else {
            result.add_structured_field(line.key, to_structured_field(line));
        }
    }
    return result.build_once();
}

bool HtslibBcfFacade::is_indexed() const
{
    const auto path = file_path_.string();
    return boost::filesystem::exists(path + ".tbi") || boost::filesystem::exists(path + ".csi");
}

HtslibBcfFacade::SyncedReaderPtr HtslibBcfFacade::open_synced_reader(const GenomicRegion* region) const
{
    SyncedReaderPtr result {bcf_sr_init()};
    if (region) {
        // htslib requires regions before readers
        const auto region_str = to_one_based_string(*region);
        if (bcf_sr_set_regions(result.get(), region_str.c_str(), 0) != 0) {
            throw std::invalid_argument {"HtslibBcfFacade: cannot query region " + region_str};
        }
    }
    if (bcf_sr_add_reader(result.get(), file_path_.c_str()) != 1) {
        if (result->errnum == idx_load_failed) throw MissingIndexError {file_path_, "vcf"};
        throw FileOpenError {file_path_, "vcf"};
    }
    return result;
}

IVcfReaderImpl::RecordCursorPtr HtslibBcfFacade::open_cursor(const UnpackPolicy level) const
{
    return std::make_unique<Cursor>(*this, open_synced_reader(nullptr), level);
}

IVcfReaderImpl::RecordCursorPtr HtslibBcfFacade::open_cursor(const GenomicRegion& region, const UnpackPolicy level) const
{
    if (is_indexed()) {
        return std::make_unique<Cursor>(*this, open_synced_reader(&region), level);
    }
    return std::make_unique<Cursor>(*this, open_synced_reader(nullptr), level, region);
}

} // namespace varcanon
