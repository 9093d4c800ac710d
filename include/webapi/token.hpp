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

#include "base/conf/token.hpp"
#include "base/types.hpp"
#include "webapi/client.hpp"

#include <filesystem>
#include <mutex>

namespace sconnect {
namespace webapi {

/// @brief Access token kept current by an external process in a file
class FileToken : public TokenProvider {
public:
  FileToken() noexcept;
  FileToken(std::filesystem::path file) noexcept : path(std::move(file)) {}

  /// @throws Error when the file is missing or empty
  string current_access_token() override;

  /// @brief Reread the file on the next request
  void refresh() override;

private:
  // order dependent
  conf::token tokc;
  std::filesystem::path path;

  // order independent
  std::mutex mtx;
  string cached;

public:
  MOD_ID("webapi.token");
};

} // namespace webapi
} // namespace sconnect
