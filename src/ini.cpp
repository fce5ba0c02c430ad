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

#include "ini.hpp"
#include "settings.hpp"
#include "stringpp.hpp"
#include <array>
#include <fstream>
#include <lanmdns/exceptions.hpp>
#include <unistd.h>

namespace lanmdnsd {

std::string get_hostname() {
  constexpr auto MAX_HOSTNAME_SIZE = 256;
  std::array<char, MAX_HOSTNAME_SIZE> hostname{0};
  ::gethostname(hostname.data(), std::size(hostname) - 1);
  return std::string(hostname.data());
}

std::string replace_hostname(const std::string &value) {
  // DO NOT USE fmt::format as it will not change both opening brackets
  const std::string placeholder = "{{hostname}}";
  if (value.find(placeholder) == std::string::npos) {
    return value;
  }
  auto hostname = get_hostname();
  auto ret = value;
  std::string::size_type n = 0;
  while ((n = ret.find(placeholder, n)) != std::string::npos) {
    ret.replace(n, placeholder.size(), hostname);
    n += hostname.size();
  }
  return ret;
}

static uint16_t parse_uint16(const std::string &value) {
  try {
    size_t end = 0;
    auto port = std::stoi(value, &end);
    if (end == value.size() && port >= 0 && port <= 0xFFFF) {
      return static_cast<uint16_t>(port);
    }
  } catch (const std::logic_error &) {
    // Not a number
  }
  throw lanmdns::exception("Invalid number: {}. Must be 0-65535", value);
}

// Loads an INI file and sets the data in the settings_t struct
void load_ini(const std::string &filename, settings_t *settings) {
  auto fd = std::ifstream(filename);
  if (!fd.is_open()) {
    throw lanmdns::exception("Cannot open ini file: {}", filename);
  }
  IniReader reader(settings);
  reader.set_filename(filename);

  std::string line;
  while (std::getline(fd, line)) {
    reader.parse_line(line);
  }
  DEBUG("Loaded {}: {}", filename, *settings);
}

void IniReader::set_filename(const std::string &filename_) {
  filename = filename_;
  lineno = 0;
}

void IniReader::parse_line(const std::string &line_) {
  lineno++;
  auto line = line_;
  auto comment_pos = line.find('#');
  if (comment_pos != std::string::npos) {
    line = line.substr(0, comment_pos);
  }
  line = trim_copy(line);
  if (line.length() == 0) {
    return;
  }

  if (line[0] == '[') {
    if (line[line.length() - 1] != ']') {
      throw lanmdns::ini_exception(filename, lineno, "Invalid section: {}",
                                   line);
    }
    section = line.substr(1, line.length() - 2);
    // Sections that can be repeated open a new item
    if (section == "service") {
      settings->services.emplace_back();
    } else if (section == "browse") {
      settings->browse.emplace_back();
    } else if (section != "general") {
      throw lanmdns::ini_exception(filename, lineno, "Invalid section: {}",
                                   section);
    }
    return;
  }

  auto eq_pos = line.find('=');
  if (eq_pos == std::string::npos) {
    throw lanmdns::ini_exception(filename, lineno, "Invalid line: {}", line);
  }
  auto key = trim_copy(line.substr(0, eq_pos));
  auto value = replace_hostname(trim_copy(line.substr(eq_pos + 1)));

  try {
    if (section == "general") {
      set_general(key, value);
    } else if (section == "service") {
      set_service(key, value);
    } else if (section == "browse") {
      set_browse(key, value);
    } else {
      throw lanmdns::ini_exception(filename, lineno, "Key out of section: {}",
                                   key);
    }
  } catch (const lanmdns::ini_exception &) {
    throw;
  } catch (const lanmdns::exception &e) {
    throw lanmdns::ini_exception(filename, lineno, "{}", e.what());
  }
}

void IniReader::set_general(const std::string &key, const std::string &value) {
  if (key == "name") {
    settings->name = value;
  } else if (key == "address") {
    settings->address = value;
  } else if (key == "log_level") {
    // Validates it
    lanmdns::str_to_log_level(value);
    settings->log_level = value;
  } else {
    throw lanmdns::ini_exception(filename, lineno, "Invalid key: {}", key);
  }
}

void IniReader::set_service(const std::string &key, const std::string &value) {
  auto &service = settings->services.back();
  if (key == "name") {
    service.name = value;
  } else if (key == "type") {
    service.type = value;
  } else if (key == "port") {
    service.port = parse_uint16(value);
  } else if (key == "priority") {
    service.priority = parse_uint16(value);
  } else if (key == "weight") {
    service.weight = parse_uint16(value);
  } else if (key == "txt") {
    service.txt.push_back(value);
  } else {
    throw lanmdns::ini_exception(filename, lineno, "Invalid key: {}", key);
  }
}

void IniReader::set_browse(const std::string &key, const std::string &value) {
  if (key == "type") {
    settings->browse.back().type = value;
  } else {
    throw lanmdns::ini_exception(filename, lineno, "Invalid key: {}", key);
  }
}

settings_t::service_t parse_service(const std::string &value) {
  auto parts = split(value, ':');
  if (parts.size() != 3) {
    throw lanmdns::exception("Invalid service {}. Expected NAME:TYPE:PORT",
                             value);
  }
  settings_t::service_t service;
  service.name = replace_hostname(parts[0]);
  service.type = parts[1];
  service.port = parse_uint16(parts[2]);
  return service;
}

} // namespace lanmdnsd
