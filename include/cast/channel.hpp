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

#include <functional>

namespace sconnect {
namespace cast {

/// @brief Application channel to a cast receiver
class Channel {
public:
  /// @brief Invoked for each message received on an application namespace
  using Receiver = std::function<void(csv ns, csv payload)>;

public:
  virtual ~Channel() = default;

  /// @brief Open the channel to the receiver
  /// @throws TransientDiscoveryError when the receiver can not be reached
  virtual void connect(csv host, Port port) = 0;

  /// @brief Launch (or join) the application and connect to its transport
  /// @throws TimeoutError when the receiver does not report the application running
  /// @throws ActivationError when the receiver refuses the launch
  virtual void launch(csv app_id) = 0;

  /// @brief Send a json payload to the launched application
  virtual void send(csv ns, csv payload) = 0;

  virtual void set_receiver(Receiver receiver) = 0;

  /// @brief Close the connection, the application stays resident
  virtual void close() noexcept = 0;
};

} // namespace cast
} // namespace sconnect
