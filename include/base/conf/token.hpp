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

#include "base/conf/toml.hpp"
#include "base/dura_t.hpp"
#include "base/types.hpp"

#include <concepts>
#include <shared_mutex>
#include <type_traits>

namespace sconnect {
namespace conf {

template <typename T>
concept IsConfVal = IsAnyOf<T, bool, string> || std::integral<T> || std::floating_point<T>;

/// @brief Provides access to configuration info using
///        the specified module id as the root.
///
///        conf::tokens are generally not used standalone.
///        Rather, they are member variables within an
///        object that requires access to the configuration
///        file.
///
///        The configuration data provided is current as of
///        the time of construction.
class token {
public:
  /// @brief Create a default token (does not point to a configuration)
  token() = default;

  /// @brief Create config token with a copy of the subtable at the
  ///        specified module id
  /// @param mid module_id (aka root)
  token(csv mid) noexcept;

  token(token &&other) = default;
  token &operator=(token &&) = default;

public:
  /// @brief Parse the configuration file into the master table.
  ///        Invoked once during startup, before any token is created.
  /// @param file full path to the toml file
  /// @param err_msg populated with the parse error (if any)
  /// @return boolean indicating success
  static bool parse_file(const string &file, string &err_msg) noexcept;

  /// @brief Replace the master table with the parsed toml text
  /// @param text toml document
  /// @return boolean indicating success
  static bool parse_text(csv text) noexcept;

  /// @brief Is the configuration provided by this token empty?
  bool empty() const noexcept { return ttable.empty(); }

  /// @brief Direct access to configuration table managed by token
  ///        Use with caution for access to configuration not handled
  ///        by member functions (e.g. array)
  const toml::table &table() const noexcept { return ttable; }

  /// @brief Retrieve configuration value located at path
  /// @tparam T Desired type of the returned value
  /// @param p Path to value, excluding root (a.k.a. module_id)
  /// @param def_val Default value if no value found at specified path
  /// @return value of type T at specified path or provided default value
  template <typename T, typename D>
    requires IsConfVal<T>
  T val(csv p, D &&def_val) const noexcept {
    const auto node = ttable.at_path(p);

    if constexpr (std::same_as<T, string>) {
      return node.value_or(string(def_val));
    } else if constexpr (std::same_as<T, bool>) {
      return node.value_or(static_cast<bool>(def_val));
    } else if constexpr (std::integral<T>) {
      return static_cast<T>(node.value_or(static_cast<int64_t>(def_val)));
    } else {
      return static_cast<T>(node.value_or(static_cast<double>(def_val)));
    }
  }

  /// @brief Retrieve a "timeout" value from the config specified as:
  ///        info = { timeout = { minutes = 1, seconds = 5, millis = 100 } }
  /// @param p path to the config value
  /// @param def_val default duration
  /// @return std::chrono::milliseconds
  template <typename DefValType>
    requires IsDuration<DefValType>
  Millis timeout_val(csv p, DefValType &&def_val) const noexcept {
    const auto node = ttable.at_path(p)["timeout"];

    if (!node.is_table()) return std::chrono::duration_cast<Millis>(def_val);

    Millis sum_ms{0};

    node.as_table()->for_each([&sum_ms](const toml::key &key, const auto &val) {
      if constexpr (toml::is_integer<decltype(val)>) {
        const int64_t v = val.get();

        if ((key == "minutes"sv) || (key == "min"sv)) {
          sum_ms += Minutes{v};
        } else if ((key == "seconds"sv) || (key == "secs"sv)) {
          sum_ms += Seconds{v};
        } else if ((key == "millis"sv) || (key == "ms"sv)) {
          sum_ms += Millis{v};
        }
      }
    });

    return sum_ms;
  }

private:
  static toml::table master;
  static std::shared_mutex master_mtx;

  // order independent
  toml::table ttable;

public:
  MOD_ID("conf.token");
};

} // namespace conf
} // namespace sconnect
