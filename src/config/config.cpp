// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "config.hpp"

#include <ostream>

#include "version.hpp"

namespace varcanon { namespace config {

namespace {

boost::optional<std::string> non_empty(std::string value)
{
    if (value.empty()) return boost::none;
    return value;
}

} // namespace

const VersionNumber Version {VARCANON_VERSION_MAJOR, VARCANON_VERSION_MINOR, VARCANON_VERSION_PATCH,
                             non_empty(VARCANON_VERSION_RELEASE), non_empty(VARCANON_GIT_COMMIT_HASH)};

std::ostream& operator<<(std::ostream& os, const VersionNumber& version)
{
    os << version.major << '.' << version.minor;
    if (version.patch) os << '.' << *version.patch;
    if (version.name) os << '-' << *version.name;
    if (version.commit) os << " (" << *version.commit << ')';
    return os;
}

const std::string BugReport {"https://github.com/varcanon/varcanon/issues"};
const std::string CopyrightNotice {"Copyright (c) 2015-2021 Daniel Cooke"};
const unsigned CommandLineWidth {72};

const std::string DefaultRelease {"GRCh37"};
const unsigned DefaultMaxAlleleLength {500};

} // namespace config
} // namespace varcanon
