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

#include "base/elapsed.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iterator>

namespace sconnect {

Nanos Elapsed::monotonic() noexcept { // static
  struct timespec tn;
  clock_gettime(CLOCK_MONOTONIC_RAW, &tn);

  return Nanos(static_cast<int64_t>(tn.tv_sec) * 1'000'000'000 + tn.tv_nsec);
}

string Elapsed::humanize(Nanos d) noexcept { // static
  string msg;
  auto w = std::back_inserter(msg);

  auto append = [&w](auto d) { fmt::format_to(w, "{} ", d); };

  if (auto x = std::chrono::duration_cast<Hours>(d); x != Hours::zero()) {
    append(x);
    d -= x;
  }

  if (auto x = std::chrono::duration_cast<Minutes>(d); x != Minutes::zero()) {
    append(x);
    d -= x;
  }

  if (auto x = std::chrono::duration_cast<Seconds>(d); x != Seconds::zero()) {
    append(x);
    d -= x;
  }

  if (auto ms = std::chrono::duration_cast<millis_fp>(d); ms > millis_fp::zero()) {
    fmt::format_to(w, "{:0.2}", ms);
  } else if (msg.empty()) {
    fmt::format_to(w, "0.0ms");
  }

  if (!msg.empty() && (msg.back() == ' ')) msg.pop_back();

  return msg;
}

} // namespace sconnect
