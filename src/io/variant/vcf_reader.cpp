// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "vcf_reader.hpp"

#include <utility>

#include "vcf_header.hpp"
#include "htslib_bcf_facade.hpp"

namespace varcanon {

VcfReader::VcfReader(Path file_path)
: file_path_ {std::move(file_path)}
, impl_ {std::make_unique<HtslibBcfFacade>(file_path_)}
{}

const VcfReader::Path& VcfReader::path() const noexcept
{
    return file_path_;
}

VcfHeader VcfReader::fetch_header() const
{
    return impl_->fetch_header();
}

bool VcfReader::is_indexed() const
{
    return impl_->is_indexed();
}

namespace {

template <typename Range>
VcfReader::RecordContainer collect(Range&& records)
{
    VcfReader::RecordContainer result {};
    for (const auto& record : records) result.push_back(record);
    return result;
}

} // namespace

VcfReader::RecordContainer VcfReader::fetch_records(const UnpackPolicy level) const
{
    return collect(iterate(level));
}

VcfReader::RecordContainer VcfReader::fetch_records(const GenomicRegion& region, const UnpackPolicy level) const
{
    return collect(iterate(region, level));
}

VcfReader::RecordRange VcfReader::iterate(const UnpackPolicy level) const
{
    return RecordRange {impl_->open_cursor(level)};
}

VcfReader::RecordRange VcfReader::iterate(const GenomicRegion& region, const UnpackPolicy level) const
{
    return RecordRange {impl_->open_cursor(region, level)};
}

// VcfReader::RecordIterator

VcfReader::RecordIterator::RecordIterator(IVcfReaderImpl::RecordCursor& cursor)
: cursor_ {&cursor}
{
    ++(*this);
}

VcfReader::RecordIterator& VcfReader::RecordIterator::operator++()
{
    if (cursor_ && !cursor_->advance()) cursor_ = nullptr;
    return *this;
}

// VcfReader::RecordRange

VcfReader::RecordRange::RecordRange(IVcfReaderImpl::RecordCursorPtr cursor)
: cursor_ {std::move(cursor)}
{}

VcfReader::RecordIterator VcfReader::RecordRange::begin()
{
    return RecordIterator {*cursor_};
}

} // namespace varcanon
