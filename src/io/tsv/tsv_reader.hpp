// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef tsv_reader_hpp
#define tsv_reader_hpp

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <cstdlib>

#include <boost/filesystem/path.hpp>

#include "htslib/hts.h"
#include "htslib/kstring.h"

namespace varcanon { namespace io {

/**
 Reads tab separated text, plain or compressed. The first line is taken to be
 the header.
 */
class TsvReader
{
public:
    using Path = boost::filesystem::path;
    using Row  = std::vector<std::string>;
    
    TsvReader() = delete;
    
    TsvReader(Path file_path);
    
    TsvReader(const TsvReader&)            = delete;
    TsvReader& operator=(const TsvReader&) = delete;
    TsvReader(TsvReader&&)                 = default;
    TsvReader& operator=(TsvReader&&)      = default;
    
    ~TsvReader() = default;
    
    const Path& path() const noexcept;
    
    const Row& header() const noexcept;
    
    // Returns false once the end of the file is reached
    bool read(Row& row);
    
    std::size_t line_number() const noexcept;
    
private:
    struct HtsFileDeleter
    {
        void operator()(htsFile* file) const { hts_close(file); }
    };
    struct KStringDeleter
    {
        void operator()(kstring_t* str) const { std::free(str->s); delete str; }
    };
    
    Path file_path_;
    std::unique_ptr<htsFile, HtsFileDeleter> file_;
    std::unique_ptr<kstring_t, KStringDeleter> line_;
    Row header_;
    std::size_t line_number_;
    
    bool read_line(Row& fields);
};

} // namespace io
} // namespace varcanon

#endif
