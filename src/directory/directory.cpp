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

#include "directory/directory.hpp"
#include "base/error.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <exception>
#include <fmt/format.h>

namespace sconnect {

static bool id_matches(const DirectoryEntry &e, csv id) noexcept {
  if (e.info.has_aliases()) {
    return std::any_of(e.info.aliases.begin(), e.info.aliases.end(),
                       [&](const Alias &a) { return boost::iequals(a.id, id); });
  }

  return boost::iequals(e.info.device_id, id);
}

static bool name_matches(const DirectoryEntry &e, csv name) noexcept {
  if (e.info.has_aliases()) {
    return std::any_of(e.info.aliases.begin(), e.info.aliases.end(),
                       [&](const Alias &a) { return boost::iequals(a.name, name); });
  }

  return boost::iequals(e.info.remote_name, name) || boost::iequals(e.name, name);
}

void Directory::subscribe(Observer *observer) noexcept {
  std::scoped_lock lck(mtx);

  observers.emplace_back(observer);
}

void Directory::unsubscribe(Observer *observer) noexcept {
  std::scoped_lock lck(mtx);

  std::erase(observers, observer);
}

DirectoryEntries Directory::snapshot() const noexcept {
  std::scoped_lock lck(mtx);

  return entries;
}

size_t Directory::size() const noexcept {
  std::scoped_lock lck(mtx);

  return entries.size();
}

OptEntry Directory::active() const noexcept {
  std::scoped_lock lck(mtx);

  auto it = std::find_if(entries.begin(), entries.end(),
                         [](const DirectoryEntry &e) { return e.is_active; });

  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

bool Directory::contains_id(csv id) const noexcept {
  std::scoped_lock lck(mtx);

  return find_id(id) != entries.end();
}

OptEntry Directory::find_by_id(csv id) const noexcept {
  std::scoped_lock lck(mtx);

  auto it = find_id(id);
  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

OptEntry Directory::find_by_name(csv name) const noexcept {
  std::scoped_lock lck(mtx);

  auto it = find_name(name);
  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

OptEntry Directory::find_by_key(csv key) const noexcept {
  std::scoped_lock lck(mtx);

  if (key.empty()) return std::nullopt;

  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const DirectoryEntry &e) { return boost::iequals(e.key(), key); });

  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

OptEntry Directory::find_by_service_name(csv name) const noexcept {
  std::scoped_lock lck(mtx);

  auto it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
    return boost::iequals(e.discovery.service_name, name);
  });

  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

OptEntry Directory::resolve(csv value, csv default_id, bool raise) const {
  INFO_AUTO_CAT("resolve");

  std::scoped_lock lck(mtx);

  const auto act = active();
  string want = boost::algorithm::trim_copy(string(value));

  if (want.empty()) {
    if (act.has_value()) return act;

    want = string(default_id);
  }

  if (want == DEFAULT_DEVICE) {
    if (default_id.empty() && act.has_value()) return act;

    want = string(default_id);
  }

  if (auto it = find_id(want); it != entries.end()) return *it;
  if (auto it = find_name(want); it != entries.end()) return *it;

  if (act.has_value()) {
    // restricted devices never appear in the device list but may still be active
    if (act->is_restricted && (boost::iequals(act->id, want) || boost::iequals(act->name, want))) {
      return act;
    }

    if (value == DEFAULT_DEVICE) return act;
  }

  INFO_AUTO("'{}' not found, active={}\n", want, act.has_value());

  if (raise) {
    throw ResolutionError(fmt::format(
        "Spotify Player device \"{}\" was not found, and there is no active Spotify player",
        want));
  }

  return std::nullopt;
}

OptEntry Directory::player_device(csv value) const noexcept {
  std::scoped_lock lck(mtx);

  const auto want = boost::algorithm::trim_copy(string(value));
  if (want.empty()) return std::nullopt;

  auto it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
    return e.is_listed &&
           (boost::iequals(e.id, want) || boost::iequals(e.name, want) ||
            boost::iequals(e.discovery.device_name, want));
  });

  return it != entries.end() ? OptEntry(*it) : std::nullopt;
}

DirectoryEntry Directory::make_dynamic(const RemoteDevice &device, csv login_id) noexcept {
  DirectoryEntry e;

  e.discovery.device_name = device.name;
  e.discovery.service_name = device.name;
  e.discovery.server = "127.0.0.1";
  e.discovery.addresses.emplace_back("127.0.0.1");
  e.discovery.port = 0;
  e.discovery.cpath = "/zc";
  e.discovery.version = "1.0";

  auto &info = e.info;
  info.active_user = string(login_id);
  info.device_id = device.id;
  info.device_type = device.type;
  info.remote_name = device.name;
  info.spotify_error = 0;
  info.status = SelfDescription::STATUS_OK;
  info.status_string = "OK";

  if (device.name == csv{"Web Player (Chrome)"}) {
    info.brand_display_name = "Google";
    info.model_display_name = "Chrome";
    info.product_id = "Web Player";
  } else if (device.name == csv{"Web Player (Microsoft Edge)"}) {
    info.brand_display_name = "Microsoft";
    info.model_display_name = "Edge";
    info.product_id = "Web Player";
  } else {
    info.brand_display_name = "unknown";
    info.model_display_name = "unknown";
    info.product_id = "unknown";
  }

  e.id = info.device_id;
  e.name = info.remote_name;

  return e;
}

void Directory::add_dynamic(const RemoteDevice &device, csv login_id) noexcept {
  INFO_AUTO_CAT("add_dynamic");

  std::scoped_lock lck(mtx);

  auto &e = entries.emplace_back(make_dynamic(device, login_id));
  const auto added = e; // sort invalidates the reference

  sort();

  INFO_AUTO("{}\n", added.inspect());
  notify(&Observer::device_added, added);
}

void Directory::reconcile_listed(const RemoteDevices &remote, csv login_id) noexcept {
  INFO_AUTO_CAT("reconcile");

  std::scoped_lock lck(mtx);

  for (auto &e : entries) {
    e.is_listed = false;
  }

  for (const auto &device : remote) {
    if (!contains_id(device.id)) add_dynamic(device, login_id);

    auto it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
      return e.info.device_id == device.id;
    });

    if (it != entries.end()) it->is_listed = true;
  }

  // dynamic entries only exist while the Web API lists them
  for (auto it = entries.begin(); it != entries.end();) {
    const bool listed = std::any_of(remote.begin(), remote.end(),
                                    [&](const RemoteDevice &d) { return d.id == it->id; });

    if (it->is_dynamic() && !listed) {
      const auto removed = *it;
      it = entries.erase(it);

      INFO_AUTO("dropped {}\n", removed.inspect());
      notify(&Observer::device_removed, removed);
    } else {
      ++it;
    }
  }
}

OptEntry Directory::mark_active(const PlaybackState &state) noexcept {
  INFO_AUTO_CAT("mark_active");

  std::scoped_lock lck(mtx);

  OptEntry result;

  for (auto &e : entries) {
    const bool was_active = e.is_active;
    e.is_active = false;

    if (state.device.has_value() && !result.has_value()) {
      const auto &dev = state.device.value();

      // restricted devices are reported without an id
      const bool match = dev.id.empty() ? name_matches(e, dev.name) : id_matches(e, dev.id);

      if (match) {
        e.is_active = true;
        e.is_restricted = dev.is_restricted;
        result.emplace(e);
      }
    }

    if (was_active != e.is_active) notify(&Observer::device_updated, e);
  }

  if (result.has_value()) INFO_AUTO("{}\n", result->inspect());

  return result;
}

size_t Directory::remove(csv id, bool dynamic_only) noexcept {
  INFO_AUTO_CAT("remove");

  std::scoped_lock lck(mtx);

  size_t count{0};

  for (auto it = entries.begin(); it != entries.end();) {
    if (boost::iequals(it->id, id) && (!dynamic_only || it->is_dynamic())) {
      const auto removed = *it;
      it = entries.erase(it);
      ++count;

      INFO_AUTO("{}\n", removed.inspect());
      notify(&Observer::device_removed, removed);
    } else {
      ++it;
    }
  }

  return count;
}

OptEntry Directory::remove_by_key(csv key) noexcept {
  INFO_AUTO_CAT("remove");

  std::scoped_lock lck(mtx);

  auto it = find_key(key);
  if (it == entries.end()) return std::nullopt;

  const auto removed = *it;
  entries.erase(it);

  INFO_AUTO("key={} {}\n", key, removed.inspect());
  notify(&Observer::device_removed, removed);

  return removed;
}

OptEntry Directory::remove_by_service_name(csv name) noexcept {
  INFO_AUTO_CAT("remove");

  std::scoped_lock lck(mtx);

  auto it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
    return boost::iequals(e.discovery.service_name, name);
  });

  if (it == entries.end()) return std::nullopt;

  const auto removed = *it;
  entries.erase(it);

  INFO_AUTO("service={} {}\n", name, removed.inspect());
  notify(&Observer::device_removed, removed);

  return removed;
}

void Directory::add_discovered(DirectoryEntry entry) noexcept {
  INFO_AUTO_CAT("add");

  std::scoped_lock lck(mtx);

  // a discovery key identifies exactly one entry
  if (!entry.key().empty()) remove_by_key(entry.key());

  // the diagnostic id is shared by every receiver that failed getInfo
  if (entry.info.device_id != GET_INFO_ERROR) {
    if (auto it = find_id(entry.info.device_id); it != entries.end()) {
      entry.is_active = it->is_active;
      entry.is_listed = it->is_listed;
      entry.is_restricted = it->is_restricted;

      const bool dynamic_only = entry.is_dynamic() || it->is_dynamic();
      remove(string(it->id), dynamic_only);
    }
  }

  entries.emplace_back(std::move(entry));
  const auto added = entries.back();

  sort();

  INFO_AUTO("{}\n", added.inspect());
  notify(&Observer::device_added, added);
}

bool Directory::update_discovery(csv service_name, const DiscoveryRecord &rec) noexcept {
  INFO_AUTO_CAT("update");

  std::scoped_lock lck(mtx);

  auto it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
    return boost::iequals(e.discovery.service_name, service_name);
  });

  if ((it == entries.end()) || (it->discovery == rec)) return false;

  // the key moved to this service, an entry still holding it is stale
  if (!rec.key.empty() && !boost::iequals(it->key(), rec.key)) {
    const auto target = string(it->discovery.service_name);

    auto other = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
      return boost::iequals(e.key(), rec.key) &&
             !boost::iequals(e.discovery.service_name, target);
    });

    if (other != entries.end()) {
      const auto removed = *other;
      entries.erase(other);

      INFO_AUTO("key={} moved, dropped {}\n", rec.key, removed.inspect());
      notify(&Observer::device_removed, removed);

      // erase invalidated the iterator
      it = std::find_if(entries.begin(), entries.end(), [&](const DirectoryEntry &e) {
        return boost::iequals(e.discovery.service_name, target);
      });
    }
  }

  it->discovery = rec;
  const auto updated = *it;

  sort();

  INFO_AUTO("{}\n", updated.inspect());
  notify(&Observer::device_updated, updated);

  return true;
}

bool Directory::apply_self_description(csv key, const SelfDescription &info) noexcept {
  INFO_AUTO_CAT("apply_info");

  std::scoped_lock lck(mtx);

  auto it = find_key(key);
  if (it == entries.end()) return false;

  // device type, brand and model describe the cast receiver, keep them
  auto &di = it->info;
  di.account_req = info.account_req;
  di.active_user = info.active_user;
  di.aliases = info.aliases;
  di.availability = info.availability;
  di.client_id = info.client_id;
  di.device_id = info.device_id;
  di.group_status = info.group_status;
  di.is_group = info.is_group;
  di.library_version = info.library_version;
  di.product_id = info.product_id;
  di.public_key = info.public_key;
  di.remote_name = info.remote_name;
  di.resolver_version = info.resolver_version;
  di.scope = info.scope;
  di.supported_capabilities = info.supported_capabilities;
  di.token_type = info.token_type;
  di.version = info.version;
  di.voice_support = info.voice_support;
  di.response_source = info.response_source;
  di.spotify_error = info.spotify_error;
  di.status = info.status;
  di.status_string = info.status_string;

  if (!info.device_id.empty()) it->id = info.device_id;

  INFO_AUTO("{}\n", it->inspect());
  notify(&Observer::device_updated, *it);

  return true;
}

bool Directory::apply_outcome(csv key, const ProtocolOutcome &outcome) noexcept {
  INFO_AUTO_CAT("apply_outcome");

  std::scoped_lock lck(mtx);

  auto it = find_key(key);
  if (it == entries.end()) return false;

  it->outcome = outcome;

  INFO_AUTO("{} {}\n", it->name, outcome);
  notify(&Observer::device_updated, *it);

  return true;
}

Directory::const_iterator Directory::find_id(csv id) const noexcept {
  if (id.empty()) return entries.end();

  return std::find_if(entries.begin(), entries.end(),
                      [&](const DirectoryEntry &e) { return id_matches(e, id); });
}

Directory::const_iterator Directory::find_name(csv name) const noexcept {
  if (name.empty()) return entries.end();

  // two devices may share a display name, prefer the active one
  const_iterator found = entries.end();

  for (auto it = entries.begin(); it != entries.end(); ++it) {
    if (name_matches(*it, name)) {
      if (it->is_active) return it;
      if (found == entries.end()) found = it;
    }
  }

  return found;
}

Directory::iterator Directory::find_key(csv key) noexcept {
  if (key.empty()) return entries.end();

  return std::find_if(entries.begin(), entries.end(),
                      [&](const DirectoryEntry &e) { return boost::iequals(e.key(), key); });
}

void Directory::notify(Notify fn, const DirectoryEntry &entry) const noexcept {
  INFO_AUTO_CAT("notify");

  for (auto *observer : observers) {
    try {
      (observer->*fn)(entry);
    } catch (const std::exception &e) {
      INFO_AUTO("observer failed for {}: {}\n", entry.name, e.what());
    } catch (...) {
      INFO_AUTO("observer failed for {}: unknown exception\n", entry.name);
    }
  }
}

void Directory::sort() noexcept {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const DirectoryEntry &lhs, const DirectoryEntry &rhs) {
                     return boost::algorithm::ilexicographical_compare(lhs.name, rhs.name);
                   });
}

} // namespace sconnect
