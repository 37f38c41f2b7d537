// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sv_caller_registry.hpp"

#include <utility>
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "utils/string_utils.hpp"
#include "dragen_cnv_support.hpp"
#include "dragen_sv_support.hpp"
#include "delly2_support.hpp"
#include "manta_support.hpp"
#include "gatk_gcnv_support.hpp"

namespace varcanon {

void SvCallerRegistry::add(std::unique_ptr<CallerSupport> support)
{
    if (!support) {
        throw std::invalid_argument {"SvCallerRegistry: null caller support"};
    }
    const auto caller = support->caller();
    if (std::any_of(std::cbegin(supports_), std::cend(supports_),
                    [caller] (const auto& s) { return s->caller() == caller; })) {
        throw std::invalid_argument {"SvCallerRegistry: " + to_string(caller) + " is already registered"};
    }
    supports_.push_back(std::move(support));
}

std::size_t SvCallerRegistry::size() const noexcept
{
    return supports_.size();
}

std::vector<SvCaller> SvCallerRegistry::callers() const
{
    std::vector<SvCaller> result(supports_.size());
    std::transform(std::cbegin(supports_), std::cend(supports_), std::begin(result),
                   [] (const auto& support) { return support->caller(); });
    return result;
}

const CallerSupport& SvCallerRegistry::get(const SvCaller caller) const
{
    const auto itr = std::find_if(std::cbegin(supports_), std::cend(supports_),
                                  [caller] (const auto& s) { return s->caller() == caller; });
    if (itr == std::cend(supports_)) {
        throw std::out_of_range {"SvCallerRegistry: " + to_string(caller) + " is not registered"};
    }
    return **itr;
}

std::vector<std::reference_wrapper<const CallerSupport>>
SvCallerRegistry::find_compatible(const VcfHeader& header) const
{
    std::vector<std::reference_wrapper<const CallerSupport>> result {};
    for (const auto& support : supports_) {
        if (support->is_compatible(header)) {
            result.emplace_back(*support);
        }
    }
    return result;
}

const CallerSupport& SvCallerRegistry::detect(const VcfHeader& header, const Path& file) const
{
    const auto matches = find_compatible(header);
    if (matches.empty()) {
        throw UnsupportedCaller {file};
    }
    if (matches.size() > 1) {
        std::vector<SvCaller> callers(matches.size());
        std::transform(std::cbegin(matches), std::cend(matches), std::begin(callers),
                       [] (const CallerSupport& support) { return support.caller(); });
        throw AmbiguousCaller {file, std::move(callers)};
    }
    return matches.front();
}

SvCallerRegistry make_sv_caller_registry(CoverageSourceMap coverage)
{
    SvCallerRegistry result {};
    result.add(std::make_unique<DragenCnvSupport>(std::move(coverage)));
    result.add(std::make_unique<DragenSvSupport>());
    result.add(std::make_unique<Delly2Support>());
    result.add(std::make_unique<MantaSupport>());
    result.add(std::make_unique<GatkGcnvSupport>());
    return result;
}

// UnsupportedCaller

UnsupportedCaller::UnsupportedCaller(Path file)
: file_ {std::move(file)}
{}

std::string UnsupportedCaller::do_where() const
{
    return "SvCallerRegistry::detect";
}

std::string UnsupportedCaller::do_why() const
{
    std::ostringstream ss {};
    ss << "The caller that wrote " << file_ << " could not be identified from its header";
    return ss.str();
}

std::string UnsupportedCaller::do_help() const
{
    std::vector<std::string> names {};
    for (const auto caller : all_sv_callers()) names.push_back(to_string(caller));
    return "provide a VCF written by one of " + utils::join(names, ", ");
}

// AmbiguousCaller

AmbiguousCaller::AmbiguousCaller(Path file, std::vector<SvCaller> matches)
: file_ {std::move(file)}
, matches_ {std::move(matches)}
{}

const std::vector<SvCaller>& AmbiguousCaller::matches() const noexcept
{
    return matches_;
}

std::string AmbiguousCaller::do_where() const
{
    return "SvCallerRegistry::detect";
}

std::string AmbiguousCaller::do_why() const
{
    std::ostringstream ss {};
    ss << "The header of " << file_ << " matches more than one caller (";
    for (std::size_t i {0}; i < matches_.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << matches_[i];
    }
    ss << ") so none was chosen";
    return ss.str();
}

std::string AmbiguousCaller::do_help() const
{
    return "check the header lines identifying the caller, e.g. ##source, have not been merged from several files";
}

} // namespace varcanon
