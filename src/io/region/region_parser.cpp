// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "region_parser.hpp"

#include <algorithm>
#include <cctype>

#include <boost/lexical_cast.hpp>

#include "exceptions/user_error.hpp"
#include "utils/string_utils.hpp"

namespace varcanon { namespace io {

namespace {

class BadRegion : public UserError
{
public:
    BadRegion(std::string region, std::string problem, std::string help)
    : region_ {std::move(region)}
    , problem_ {std::move(problem)}
    , help_ {std::move(help)}
    {}
    
private:
    std::string region_, problem_, help_;
    
    std::string do_where() const override { return "parse_region"; }
    std::string do_why() const override { return "the region '" + region_ + "' " + problem_; }
    std::string do_help() const override { return help_; }
};

const std::string syntax_help {"write regions as contig[:first[-[last]]] using one-based positions"};

BadRegion malformed(const std::string& region, std::string problem = "is not formatted correctly")
{
    return BadRegion {region, std::move(problem), syntax_help};
}

BadRegion unknown_contig(const std::string& region, const ReferenceGenome& reference)
{
    return BadRegion {region, "names a contig that is not in " + reference.name(),
                      "check the contig names in the reference " + reference.name()};
}

// One-based input position
GenomicRegion::Position to_position(const std::string& token, const std::string& region)
{
    if (token.empty() || !std::all_of(std::cbegin(token), std::cend(token),
                                            [] (unsigned char c) { return std::isdigit(c); })) {
        throw malformed(region);
    }
    GenomicRegion::Position result;
    try {
        result = boost::lexical_cast<GenomicRegion::Position>(token);
    } catch (const boost::bad_lexical_cast&) {
        throw malformed(region, "has a position that is too large");
    }
    if (result == 0) throw malformed(region, "has position 0 but positions start at 1");
    return result;
}

} // namespace

GenomicRegion parse_region(std::string region, const ReferenceGenome& reference)
{
    if (reference.has_contig(region)) return reference.contig_region(region);
    const auto separator = region.rfind(':');
    if (separator == std::string::npos) throw unknown_contig(region, reference);
    const auto contig = region.substr(0, separator);
    if (!reference.has_contig(contig)) throw unknown_contig(region, reference);
    
    auto bounds = region.substr(separator + 1);
    utils::strip(bounds, ',');
    const auto dash = bounds.find('-');
    const auto contig_size = reference.contig_size(contig);
    const auto begin = std::min(to_position(bounds.substr(0, dash), region) - 1, contig_size);
    GenomicRegion::Position end;
    if (dash == std::string::npos) {
        end = std::min(begin + 1, contig_size);
    } else if (dash + 1 == bounds.size()) {
        end = contig_size;
    } else {
        end = std::min(to_position(bounds.substr(dash + 1), region), contig_size);
        if (end < begin) throw malformed(region, "ends before it begins");
    }
    return GenomicRegion {contig, begin, end};
}

} // namespace io
} // namespace varcanon
