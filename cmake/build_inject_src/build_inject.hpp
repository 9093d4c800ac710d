// sconnect
// Copyright (C) 2022  Tim Hughey
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// https://www.wisslanding.com

#pragma once

#include <filesystem>
#include <string>

namespace sconnect {
namespace build {

using fs_path = std::filesystem::path;
using string = std::string;

/// @brief Values captured when CMake configured the build
struct info_t {
  const string project;
  const string git;         // git describe, project version outside a checkout
  const fs_path sysconf_dir; // default location of live.toml
};

extern const info_t info;

} // namespace build
} // namespace sconnect
