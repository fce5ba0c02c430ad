/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <lanmdns/formatterhelper.hpp>
#include <lanmdns/logger.hpp>
#include <string>
#include <vector>

namespace lanmdnsd {

struct settings_t {
  // Host name, {{hostname}} when empty
  std::string name;
  // Local address to bind to. Empty to find one.
  std::string address;
  std::string log_level = "info";

  // Datas as read from the ini file
  struct service_t {
    std::string name;
    std::string type;
    uint16_t port = 0;
    uint16_t priority = 0;
    uint16_t weight = 0;
    std::vector<std::string> txt;
  };

  struct browse_t {
    std::string type;
  };

  std::vector<service_t> services;
  std::vector<browse_t> browse;
};

extern settings_t settings; // NOLINT

void load_ini(const std::string &filename, settings_t *settings);
void parse_argv(const std::vector<std::string> &argv, settings_t *settings);
// "NAME:TYPE:PORT"
settings_t::service_t parse_service(const std::string &value);
} // namespace lanmdnsd

BASIC_FORMATTER(lanmdnsd::settings_t::service_t, "service_t[{}, {}, {}]",
                v.name, v.type, v.port);
BASIC_FORMATTER(lanmdnsd::settings_t::browse_t, "browse_t[{}]", v.type);

VECTOR_FORMATTER(lanmdnsd::settings_t::service_t);
VECTOR_FORMATTER(lanmdnsd::settings_t::browse_t);

BASIC_FORMATTER(lanmdnsd::settings_t, "settings_t[{}, {}, {}, {}, {}]", v.name,
                v.address, v.log_level, v.services, v.browse);
