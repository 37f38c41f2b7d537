// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef config_hpp
#define config_hpp

#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

namespace varcanon { namespace config {

struct VersionNumber
{
    unsigned short major, minor;
    boost::optional<unsigned short> patch = boost::none;
    boost::optional<std::string> name = boost::none;
    boost::optional<std::string> commit = boost::none;
};

extern const VersionNumber Version;

std::ostream& operator<<(std::ostream& os, const VersionNumber& version);

extern const std::string BugReport, CopyrightNotice;

extern const unsigned CommandLineWidth;

// Assembly tag written to the release column of every imported table
extern const std::string DefaultRelease;

// Width of the ref and alt columns; longer alleles are skipped on import
extern const unsigned DefaultMaxAlleleLength;

} // namespace config
} // namespace varcanon

#endif
