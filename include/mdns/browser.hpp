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
#include "mdns/listener.hpp"
#include "mdns/record.hpp"

#include <atomic>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/thread-watch.h>
#include <set>
#include <type_traits>
#include <vector>

namespace sconnect {
namespace mdns {

/// @brief Browses one or more service types using an Avahi threaded poll
///        and dispatches resolved services to the registered listeners
class Browser {
public:
  Browser() noexcept;
  ~Browser() noexcept;

  Browser(const Browser &) = delete;
  Browser &operator=(const Browser &) = delete;

  /// @brief Register a listener, must be called before start()
  void add_listener(Listener *listener) noexcept { listeners.emplace_back(listener); }

  /// @brief Start the threaded poll, browsing begins once the client is running
  /// @return empty string on success, otherwise the failure reason
  string start() noexcept;

  bool all_for_now() const noexcept { return all_for_now_state.load(); }

private:
  void browse(csv stype) noexcept;

  void dispatch_resolved(Record rec) noexcept;
  void dispatch_removed(Record rec) noexcept;

  Listener *find_listener(csv stype) noexcept;

  // avahi callbacks
  static void cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags flags, void *d);
  static void cb_client(AvahiClient *client, AvahiClientState state, void *d);
  static void cb_resolve(AvahiServiceResolver *r, AvahiIfIndex interface, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags flags, void *d);

  template <typename T> static string error_string(T t) {
    using U = std::remove_pointer_t<T>;

    if constexpr (std::is_same_v<U, AvahiClient>) {
      return string(avahi_strerror(avahi_client_errno(t)));
    } else if constexpr (std::is_same_v<U, AvahiServiceBrowser>) {
      return error_string(avahi_service_browser_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiServiceResolver>) {
      return error_string(avahi_service_resolver_get_client(t));
    } else {
      static_assert(AlwaysFalse<U>, "unhandled Avahi type");
    }
  }

  static TxtList make_txt_list(AvahiStringList *txt) noexcept;

private:
  // order dependent
  std::atomic_bool all_for_now_state;
  std::atomic_bool client_running;
  AvahiThreadedPoll *tpoll{nullptr};

  // order independent
  AvahiClient *client{nullptr};
  std::vector<Listener *> listeners;
  std::vector<AvahiServiceBrowser *> browsers;

  // type + name of every resolved instance, distinguishes add from update
  std::set<std::pair<string, string>> known;

public:
  MOD_ID("mdns.browser");
  static constexpr csv thread_name{"sconnect_mdns"};
};

} // namespace mdns
} // namespace sconnect
