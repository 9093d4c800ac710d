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

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sconnect {

/// @brief Latching flag used to hand an outcome from one thread to a waiter.
///        Once set, every wait returns immediately until clear() is called.
class Signal {
public:
  Signal() = default;
  Signal(const Signal &) = delete;
  Signal &operator=(const Signal &) = delete;

  void clear() noexcept {
    std::scoped_lock lck(mtx);
    flag = false;
  }

  bool is_set() const noexcept {
    std::scoped_lock lck(mtx);
    return flag;
  }

  void set() noexcept {
    {
      std::scoped_lock lck(mtx);
      flag = true;
    }

    cv.notify_all();
  }

  /// @brief Wait for the signal to be set, never longer than timeout
  /// @param timeout maximum duration to wait
  /// @return true when the signal was set, false when the wait expired
  template <typename D> bool wait_for(const D &timeout) noexcept {
    std::unique_lock lck(mtx);

    return cv.wait_for(lck, timeout, [this]() { return flag; });
  }

  /// @brief Block until the signal is set
  void wait() noexcept {
    std::unique_lock lck(mtx);
    cv.wait(lck, [this]() { return flag; });
  }

private:
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool flag{false};
};

} // namespace sconnect
