// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef vcf_reader_impl_hpp
#define vcf_reader_impl_hpp

#include <memory>

namespace varcanon {

class GenomicRegion;
class VcfHeader;
class VcfRecord;

class IVcfReaderImpl
{
public:
    // sites skips the sample columns
    enum class UnpackPolicy { all, sites };
    
    // Single pass over the records of one query
    class RecordCursor
    {
    public:
        virtual ~RecordCursor() = default;
        
        // Moves to the next record, returning false once exhausted
        virtual bool advance() = 0;
        virtual const VcfRecord& record() const noexcept = 0;
    };
    
    using RecordCursorPtr = std::unique_ptr<RecordCursor>;
    
    virtual ~IVcfReaderImpl() = default;
    
    virtual VcfHeader fetch_header() const = 0;
    virtual bool is_indexed() const = 0;
    virtual RecordCursorPtr open_cursor(UnpackPolicy level) const = 0;
    virtual RecordCursorPtr open_cursor(const GenomicRegion& region, UnpackPolicy level) const = 0;
};

} // namespace varcanon

#endif
