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

#include "base/types.hpp"
#include "device/entry.hpp"
#include "device/remote.hpp"
#include "directory/observer.hpp"

#include <mutex>
#include <vector>

namespace sconnect {

/// @brief Lock protected registry of directory entries kept sorted by name.
///        Every query returns a copy taken under the lock.
class Directory {
public:
  static constexpr csv DEFAULT_DEVICE{"*"};
  static constexpr csv GET_INFO_ERROR{"getInfoError"};

public:
  Directory() = default;
  Directory(const Directory &) = delete;
  Directory &operator=(const Directory &) = delete;

  void subscribe(Observer *observer) noexcept;
  void unsubscribe(Observer *observer) noexcept;

  /// @brief Copy of every entry
  DirectoryEntries snapshot() const noexcept;
  size_t size() const noexcept;

  // lookups, all case-insensitive and alias aware where noted
  OptEntry active() const noexcept;
  bool contains_id(csv id) const noexcept;
  OptEntry find_by_id(csv id) const noexcept;          // alias aware
  OptEntry find_by_name(csv name) const noexcept;      // alias aware, prefers active
  OptEntry find_by_key(csv key) const noexcept;
  OptEntry find_by_service_name(csv name) const noexcept;

  /// @brief Map a caller supplied value to an entry
  /// @param value device id, device name, "*" for the default device or
  ///              empty for the active device
  /// @param default_id device id used for "*" and as the fallback for empty
  /// @param raise throw ResolutionError when nothing matches
  /// @return matching entry or std::nullopt (raise == false)
  OptEntry resolve(csv value, csv default_id, bool raise = true) const;

  /// @brief First listed entry whose id, name or discovery name matches
  OptEntry player_device(csv value) const noexcept;

  // mutations, each fires the corresponding notification before returning

  /// @brief Add an entry for a device known only through the Web API
  void add_dynamic(const RemoteDevice &device, csv login_id) noexcept;

  /// @brief Recompute is_listed from the Web API device list, add missing
  ///        devices and drop dynamic entries no longer listed
  void reconcile_listed(const RemoteDevices &remote, csv login_id) noexcept;

  /// @brief Recompute is_active from the Web API playback state
  /// @return the entry now marked active (if any)
  OptEntry mark_active(const PlaybackState &state) noexcept;

  /// @brief Remove every entry with the id
  /// @param dynamic_only limit removal to dynamic entries
  /// @return number of entries removed
  size_t remove(csv id, bool dynamic_only = false) noexcept;
  OptEntry remove_by_key(csv key) noexcept;
  OptEntry remove_by_service_name(csv name) noexcept;

  /// @brief Add a newly discovered entry.  An existing entry with the same id
  ///        hands over its active and listed flags and is removed; an existing
  ///        entry with the same discovery key is replaced.
  void add_discovered(DirectoryEntry entry) noexcept;

  /// @brief Replace the discovery record of the entry with the service name
  /// @return true when the record differed and was replaced
  bool update_discovery(csv service_name, const DiscoveryRecord &rec) noexcept;

  /// @brief Refine identity from a cast getInfoResponse
  bool apply_self_description(csv key, const SelfDescription &info) noexcept;

  /// @brief Record the latest protocol outcome for the entry with the key
  bool apply_outcome(csv key, const ProtocolOutcome &outcome) noexcept;

  /// @brief Fabricate the entry used for a device known only by the Web API
  static DirectoryEntry make_dynamic(const RemoteDevice &device, csv login_id) noexcept;

private:
  using iterator = DirectoryEntries::iterator;
  using const_iterator = DirectoryEntries::const_iterator;
  using Notify = void (Observer::*)(const DirectoryEntry &);

  const_iterator find_id(csv id) const noexcept;
  const_iterator find_name(csv name) const noexcept;
  iterator find_key(csv key) noexcept;

  void notify(Notify fn, const DirectoryEntry &entry) const noexcept;
  void sort() noexcept;

private:
  // order independent
  mutable std::recursive_mutex mtx;
  DirectoryEntries entries;
  std::vector<Observer *> observers;

public:
  MOD_ID("directory");
};

} // namespace sconnect
