// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sv_caller_registry_hpp
#define sv_caller_registry_hpp

#include <string>
#include <vector>
#include <memory>
#include <functional>

#include <boost/filesystem/path.hpp>

#include "exceptions/user_error.hpp"
#include "io/variant/vcf_header.hpp"
#include "io/coverage/coverage_source.hpp"
#include "caller_support.hpp"
#include "sv_caller.hpp"

namespace varcanon {

/*
 The supported callers, in registration order. Detection asks every caller
 whether it recognises a header and only succeeds if exactly one does.
 */
class SvCallerRegistry
{
public:
    using Path = boost::filesystem::path;
    
    SvCallerRegistry() = default;
    
    SvCallerRegistry(const SvCallerRegistry&)            = delete;
    SvCallerRegistry& operator=(const SvCallerRegistry&) = delete;
    SvCallerRegistry(SvCallerRegistry&&)                 = default;
    SvCallerRegistry& operator=(SvCallerRegistry&&)      = default;
    
    ~SvCallerRegistry() = default;
    
    // A caller may only be registered once
    void add(std::unique_ptr<CallerSupport> support);
    
    std::size_t size() const noexcept;
    
    std::vector<SvCaller> callers() const;
    
    const CallerSupport& get(SvCaller caller) const;
    
    std::vector<std::reference_wrapper<const CallerSupport>> find_compatible(const VcfHeader& header) const;
    
    // Throws UnsupportedCaller or AmbiguousCaller unless exactly one caller matches
    const CallerSupport& detect(const VcfHeader& header, const Path& file = {}) const;
    
private:
    std::vector<std::unique_ptr<CallerSupport>> supports_;
};

// All supported callers. DRAGEN CNV takes the coverage sources.
SvCallerRegistry make_sv_caller_registry(CoverageSourceMap coverage = {});

class UnsupportedCaller : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    UnsupportedCaller(Path file);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
};

class AmbiguousCaller : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    AmbiguousCaller(Path file, std::vector<SvCaller> matches);
    
    const std::vector<SvCaller>& matches() const noexcept;
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    Path file_;
    std::vector<SvCaller> matches_;
};

} // namespace varcanon

#endif
