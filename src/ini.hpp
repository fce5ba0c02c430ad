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

#include "settings.hpp"
#include <string>

namespace lanmdnsd {

class IniReader {
  settings_t *settings;
  std::string filename = "<none>";
  std::string section;
  int lineno = 0;

  void set_general(const std::string &key, const std::string &value);
  void set_service(const std::string &key, const std::string &value);
  void set_browse(const std::string &key, const std::string &value);

public:
  explicit IniReader(settings_t *settings) : settings(settings) {}

  void set_filename(const std::string &filename);
  // Throws ini_exception
  void parse_line(const std::string &line);
};

// {{hostname}} is replaced by the result of gethostname
std::string replace_hostname(const std::string &value);
std::string get_hostname();
} // namespace lanmdnsd
