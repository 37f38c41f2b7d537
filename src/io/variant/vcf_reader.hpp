// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef vcf_reader_hpp
#define vcf_reader_hpp

#include <vector>
#include <memory>
#include <iterator>
#include <cstddef>

#include <boost/filesystem/path.hpp>

#include "vcf_reader_impl.hpp"
#include "vcf_record.hpp"

namespace varcanon {

class VcfHeader;
class GenomicRegion;

/**
 Read-only access to a VCF or BCF file.
 
 Region queries use the .tbi or .csi index beside the file if there is one,
 otherwise the whole file is streamed and records not overlapping the
 region are dropped.
 */
class VcfReader
{
public:
    using Path            = boost::filesystem::path;
    using UnpackPolicy    = IVcfReaderImpl::UnpackPolicy;
    using RecordContainer = std::vector<VcfRecord>;
    
    class RecordIterator;
    class RecordRange;
    
    VcfReader() = delete;
    
    explicit VcfReader(Path file_path);
    
    VcfReader(const VcfReader&)            = delete;
    VcfReader& operator=(const VcfReader&) = delete;
    VcfReader(VcfReader&&)                 = default;
    VcfReader& operator=(VcfReader&&)      = default;
    
    ~VcfReader() = default;
    
    const Path& path() const noexcept;
    
    VcfHeader fetch_header() const;
    bool is_indexed() const;
    
    RecordContainer fetch_records(UnpackPolicy level = UnpackPolicy::all) const;
    RecordContainer fetch_records(const GenomicRegion& region, UnpackPolicy level = UnpackPolicy::all) const;
    
    // The range must not outlive the reader
    RecordRange iterate(UnpackPolicy level = UnpackPolicy::all) const;
    RecordRange iterate(const GenomicRegion& region, UnpackPolicy level = UnpackPolicy::all) const;
    
private:
    Path file_path_;
    std::unique_ptr<IVcfReaderImpl> impl_;
};

class VcfReader::RecordIterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = VcfRecord;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const VcfRecord*;
    using reference         = const VcfRecord&;
    
    RecordIterator() = default; // end
    explicit RecordIterator(IVcfReaderImpl::RecordCursor& cursor);
    
    reference operator*() const { return cursor_->record(); }
    pointer operator->() const { return &cursor_->record(); }
    RecordIterator& operator++();
    
    friend bool operator==(const RecordIterator& lhs, const RecordIterator& rhs) noexcept
    {
        return lhs.cursor_ == rhs.cursor_;
    }
    friend bool operator!=(const RecordIterator& lhs, const RecordIterator& rhs) noexcept
    {
        return !(lhs == rhs);
    }
    
private:
    IVcfReaderImpl::RecordCursor* cursor_ = nullptr;
};

class VcfReader::RecordRange
{
public:
    explicit RecordRange(IVcfReaderImpl::RecordCursorPtr cursor);
    
    RecordRange(const RecordRange&)            = delete;
    RecordRange& operator=(const RecordRange&) = delete;
    RecordRange(RecordRange&&)                 = default;
    RecordRange& operator=(RecordRange&&)      = default;
    
    // Input range, begin may only be called once
    RecordIterator begin();
    RecordIterator end() const noexcept { return RecordIterator {}; }
    
private:
    IVcfReaderImpl::RecordCursorPtr cursor_;
};

} // namespace varcanon

#endif
