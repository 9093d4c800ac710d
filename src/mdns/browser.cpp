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

#include "mdns/browser.hpp"
#include "base/logger.hpp"
#include "base/threads.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <fmt/format.h>

namespace sconnect {
namespace mdns {

Browser::Browser() noexcept
    : all_for_now_state(false), //
      client_running(false),    //
      tpoll(avahi_threaded_poll_new()) {}

Browser::~Browser() noexcept {
  INFO_AUTO_CAT("shutdown");

  client_running = false;

  if (tpoll) avahi_threaded_poll_stop(tpoll);

  // freeing the client also frees browsers and pending resolvers
  if (client) avahi_client_free(client);
  if (tpoll) avahi_threaded_poll_free(tpoll);

  INFO_AUTO("browsers={} known={}\n", browsers.size(), known.size());
}

string Browser::start() noexcept {
  INFO_AUTO_CAT("start");

  if (tpoll == nullptr) return string("failed to allocate threaded_poll");

  int err{0};

  // notes:
  //  1. the client pointer is captured in cb_client so the first invocation
  //     (on the poll thread) can name the thread
  //  2. AVAHI_CLIENT_NO_FAIL creates the client even if the daemon is unavailable
  //     and enters CLIENT_FAILURE state if the client is forced to disconnect
  const AvahiClientFlags flags = AVAHI_CLIENT_NO_FAIL;
  auto poll = avahi_threaded_poll_get(tpoll);
  auto new_client = avahi_client_new(poll, flags, Browser::cb_client, this, &err);

  if (new_client == nullptr) {
    return fmt::format("failed to allocate client: {}", avahi_strerror(err));
  }

  client = new_client;

  if (err = avahi_threaded_poll_start(tpoll); err) {
    return string(avahi_strerror(err));
  }

  INFO_AUTO("sizeof={:>5} listeners={}\n", sizeof(Browser), listeners.size());

  return string();
}

void Browser::browse(csv stype) noexcept {
  INFO_AUTO_CAT("browse");

  const string type(stype);

  auto sb = avahi_service_browser_new(client,              // client
                                      AVAHI_IF_UNSPEC,     // network interface
                                      AVAHI_PROTO_INET,    // ipv4 only
                                      type.c_str(),        // service type
                                      nullptr,             // domain
                                      (AvahiLookupFlags)0, // lookup flags
                                      Browser::cb_browse,  // callback
                                      this);               // userdata
  if (sb == nullptr) {
    INFO_AUTO("create failed {} reason={}\n", stype, error_string(client));
  } else {
    browsers.emplace_back(sb);
    INFO_AUTO("initiated browse for {}\n", stype);
  }
}

// called when a service becomes available or is removed from the network
void Browser::cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags, void *user_data) { // static
  INFO_AUTO_CAT("cb_browse");

  auto self = static_cast<Browser *>(user_data);

  switch (event) {
  case AVAHI_BROWSER_FAILURE: {
    INFO_AUTO("browser={} error={}\n", fmt::ptr(b), error_string(b));
  } break;

  case AVAHI_BROWSER_NEW: {
    INFO_AUTO("NEW {} {}\n", type, name);

    // default flags (for clarity)
    AvahiLookupFlags flags{};

    auto r = avahi_service_resolver_new(self->client,       // the client
                                        iface,              // same interface
                                        protocol,           // same protocol
                                        name,               // same service name
                                        type,               // same service type
                                        domain,             // same domain
                                        AVAHI_PROTO_INET,   // ipv4 addresses
                                        flags,              // resolve flags
                                        cb_resolve,         // callback when resolved
                                        user_data);         // same userdata (browser)

    // the callback function frees the resolver
    if (!r) INFO_AUTO("RESOLVER failed, service={}\n", type);
  } break;

  case AVAHI_BROWSER_REMOVE: {
    INFO_AUTO("REMOVE {} {} {}\n", name, type, domain);

    self->dispatch_removed(Record({.name = name, .type = type, .domain = domain}));
  } break;

  case AVAHI_BROWSER_ALL_FOR_NOW:
  case AVAHI_BROWSER_CACHE_EXHAUSTED: {
    self->all_for_now_state = true;
  } break;
  }
}

void Browser::cb_client(AvahiClient *client, AvahiClientState state, void *user_data) { // static
  INFO_AUTO_CAT("cb_client");

  auto self = static_cast<Browser *>(user_data);

  switch (state) {
  case AVAHI_CLIENT_CONNECTING: {
    INFO_AUTO("CONNECTING, client={}\n", fmt::ptr(client));
  } break;

  case AVAHI_CLIENT_S_REGISTERING: {
    INFO_AUTO("REGISTERING, client={}\n", fmt::ptr(client));
  } break;

  case AVAHI_CLIENT_S_RUNNING: {
    name_thread(thread_name);

    // cb_client fires from within avahi_client_new(), before start() has
    // stored the pointer
    self->client = client;

    const string domain(avahi_client_get_domain_name(client));
    const string vsn(avahi_client_get_version_string(client));

    INFO_AUTO("RUNNING, vsn='{}' domain={}\n", vsn, domain);

    if (std::atomic_exchange(&(self->client_running), true) == false) {
      for (auto *listener : self->listeners) {
        self->browse(listener->service_type());
      }
    }
  } break;

  case AVAHI_CLIENT_FAILURE: {
    INFO_AUTO("FAILED, reason={}\n", error_string(client));
  } break;

  case AVAHI_CLIENT_S_COLLISION: {
    INFO_AUTO("NAME COLLISION, reason={}\n", error_string(client));
  } break;
  }
}

void Browser::cb_resolve(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags, void *user_data) { // static
  INFO_AUTO_CAT("resolve");

  auto self = static_cast<Browser *>(user_data);

  switch (event) {
  case AVAHI_RESOLVER_FAILURE: {
    INFO_AUTO("FAILED {} reason={}\n", name, error_string(r));
  } break;

  case AVAHI_RESOLVER_FOUND: {
    if (address->proto != AVAHI_PROTO_INET) {
      INFO_AUTO("skipping non-ipv4 address for {}\n", name);
      break;
    }

    std::array<char, AVAHI_ADDRESS_STR_MAX> addr_str{0};

    self->dispatch_resolved(Record({
        .name = name,                                                                //
        .type = type,                                                                //
        .domain = domain,                                                            //
        .hostname = host_name,                                                       //
        .address = avahi_address_snprint(addr_str.data(), addr_str.size(), address), //
        .port = port,                                                                //
        .protocol = avahi_proto_to_string(protocol),                                 //
        .txt_list = make_txt_list(txt)                                               //
    }));
  } break;
  }

  if (r) avahi_service_resolver_free(r);
}

void Browser::dispatch_removed(Record rec) noexcept {
  INFO_AUTO_CAT("removed");

  known.erase({rec.type(), rec.name()});

  if (auto *listener = find_listener(rec.type()); listener != nullptr) {
    try {
      listener->service_removed(rec);
    } catch (const std::exception &e) {
      INFO_AUTO("{} listener failed: {}\n", rec.name(), e.what());
    }
  }
}

void Browser::dispatch_resolved(Record rec) noexcept {
  INFO_AUTO_CAT("resolved");

  auto [it, inserted] = known.emplace(rec.type(), rec.name());

  INFO_AUTO("{} {}\n", inserted ? "added" : "updated", rec.inspect());

  if (auto *listener = find_listener(rec.type()); listener != nullptr) {
    try {
      if (inserted) {
        listener->service_added(rec);
      } else {
        listener->service_updated(rec);
      }
    } catch (const std::exception &e) {
      INFO_AUTO("{} listener failed: {}\n", rec.name(), e.what());
    }
  }
}

Listener *Browser::find_listener(csv stype) noexcept {
  auto it = std::find_if(listeners.begin(), listeners.end(),
                         [&](const Listener *l) { return l->service_type() == stype; });

  return it != listeners.end() ? *it : nullptr;
}

TxtList Browser::make_txt_list(AvahiStringList *txt) noexcept { // static
  TxtList txt_list;

  for (AvahiStringList *e = txt; e != nullptr; e = avahi_string_list_get_next(e)) {
    char *key{nullptr};
    char *val{nullptr};
    size_t val_size{0};

    if (auto rc = avahi_string_list_get_pair(e, &key, &val, &val_size); rc == 0) {
      txt_list.emplace_back(key, val ? csv(val, val_size) : csv());

      avahi_free(key);
      avahi_free(val);
    }
  }

  return txt_list;
}

} // namespace mdns
} // namespace sconnect
