// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef path_utils_hpp
#define path_utils_hpp

#include <boost/filesystem/path.hpp>

namespace varcanon {

namespace fs = boost::filesystem;

// Replaces a leading ~/ with $HOME
fs::path expand_user_path(const fs::path& path);

// Absolute form of path, taking relative paths from working_directory
fs::path resolve_path(const fs::path& path, const fs::path& working_directory);

} // namespace varcanon

#endif
