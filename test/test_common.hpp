// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef test_common_hpp
#define test_common_hpp

#include <string>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace varcanon { namespace test {

namespace detail {
    static const fs::path resources_dir {VARCANON_TEST_RESOURCES_DIR};
} // namespace detail

inline fs::path resource(const std::string& name)
{
    return detail::resources_dir / name;
}

// Full paths

static const fs::path reference_fasta {resource("reference.fa")};

static const fs::path exac_vcf {resource("exac.vcf")};
static const fs::path thousand_genomes_vcf {resource("thousand_genomes.vcf")};
static const fs::path coverage_vcf {resource("coverage.vcf")};

static const fs::path dragen_cnv_vcf {resource("dragen_cnv.vcf")};
static const fs::path dragen_sv_vcf {resource("dragen_sv.vcf")};
static const fs::path delly2_vcf {resource("delly2.vcf")};
static const fs::path manta_vcf {resource("manta.vcf")};
static const fs::path gatk_gcnv_vcf {resource("gatk_gcnv.vcf")};
static const fs::path unknown_caller_vcf {resource("unknown_caller.vcf")};

static const fs::path clinvar_tsv {resource("clinvar.tsv")};
static const fs::path bad_header_clinvar_tsv {resource("clinvar_bad_header.tsv")};

// Removes the file on scope exit
class TemporaryFile
{
public:
    TemporaryFile(const std::string& extension = ".db")
    : path_ {fs::temp_directory_path() / fs::unique_path("varcanon-%%%%-%%%%-%%%%" + extension)}
    {}
    
    TemporaryFile(const TemporaryFile&)            = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;
    
    ~TemporaryFile()
    {
        boost::system::error_code ec {};
        fs::remove(path_, ec);
    }
    
    const fs::path& path() const noexcept { return path_; }
    
private:
    fs::path path_;
};

} // namespace test
} // namespace varcanon

#endif
