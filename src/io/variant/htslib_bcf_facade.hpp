// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef htslib_bcf_facade_hpp
#define htslib_bcf_facade_hpp

#include <string>
#include <vector>
#include <memory>

#include <boost/filesystem/path.hpp>

#include "htslib/vcf.h"
#include "htslib/synced_bcf_reader.h"

#include "vcf_reader_impl.hpp"

namespace varcanon {

class VcfRecord;

// Reads VCF and BCF through htslib's synced reader
class HtslibBcfFacade : public IVcfReaderImpl
{
public:
    using Path = boost::filesystem::path;
    
    HtslibBcfFacade() = delete;
    
    explicit HtslibBcfFacade(Path file_path);
    
    HtslibBcfFacade(const HtslibBcfFacade&)            = delete;
    HtslibBcfFacade& operator=(const HtslibBcfFacade&) = delete;
    
    ~HtslibBcfFacade() override = default;
    
    VcfHeader fetch_header() const override;
    bool is_indexed() const override;
    RecordCursorPtr open_cursor(UnpackPolicy level) const override;
    RecordCursorPtr open_cursor(const GenomicRegion& region, UnpackPolicy level) const override;
    
private:
    struct HeaderDeleter
    {
        void operator()(bcf_hdr_t* header) const { bcf_hdr_destroy(header); }
    };
    struct SyncedReaderDeleter
    {
        void operator()(bcf_srs_t* reader) const { bcf_sr_destroy(reader); }
    };
    
    using HeaderPtr       = std::unique_ptr<bcf_hdr_t, HeaderDeleter>;
    using SyncedReaderPtr = std::unique_ptr<bcf_srs_t, SyncedReaderDeleter>;
    
    class Cursor;
    
    Path file_path_;
    HeaderPtr header_;
    
    SyncedReaderPtr open_synced_reader(const GenomicRegion* region) const;
    VcfRecord decode(bcf1_t* line, UnpackPolicy level) const;
};

} // namespace varcanon

#endif
