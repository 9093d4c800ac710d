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

#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <type_traits>

namespace sconnect {

/// @brief Monotonic time passed since construction
class Elapsed {
public:
  Elapsed() noexcept : start(monotonic()) {}

  Nanos operator()() const noexcept { return monotonic() - start; }

  /// @brief Elapsed time as a duration or an integral count of nanoseconds
  template <typename TO> TO as() const noexcept {
    if constexpr (IsDuration<TO>) {
      return std::chrono::duration_cast<TO>((*this)());
    } else if constexpr (std::signed_integral<TO>) {
      return (*this)().count();
    } else {
      static_assert(AlwaysFalse<TO>, "unsupported type");
      return 0;
    }
  }

  /// @brief Elapsed time for humans (e.g. 1min 20s 3.25ms)
  string humanize() const noexcept { return humanize((*this)()); }
  static string humanize(Nanos d) noexcept;

private:
  static Nanos monotonic() noexcept;

private:
  const Nanos start;
};

} // namespace sconnect
