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
#include <functional>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>
#include <string>
#include <vector>

namespace lanmdnsd {

#ifndef LANMDNS_VERSION
// NOLINTNEXTLINE
#define LANMDNS_VERSION "unknown"
#endif

// NOLINTNEXTLINE
const char *VERSION = LANMDNS_VERSION;

// NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
constexpr const char *const CMDLINE_HELP = &R"(
Multicast DNS service discovery daemon v{}
(C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
Announces services on the local network and browses for others.

The host name and each service name are probed for uniqueness, announced,
and kept alive until exit, when goodbyes are sent. If the network goes
down the daemon recovers and announces everything again.

Options:
)"[1];

struct argument_t {
  std::string arg;
  std::string comment;
  std::function<void(const std::string &)> fn;
  bool has_second_argument = true;

  // NOLINTNEXTLINE
  argument_t(const std::string &arg, const std::string &comment,
             std::function<void(const std::string &)> fn,
             bool has_second_argument = true)
      : arg(arg), comment(comment), fn(fn),
        has_second_argument(has_second_argument) {}
};

static void help(const std::vector<argument_t> &arguments) {
  std::print(CMDLINE_HELP, VERSION);
  for (auto &argument : arguments) {
    std::print("  {:<30} {}\n", argument.arg, argument.comment);
  }
}

// Setup the argument options
static std::vector<argument_t> setup_arguments(settings_t *settings) {
  std::vector<argument_t> arguments;

  arguments.emplace_back( //
      "--ini",            //
      "Loads an INI file as default configuration. Depending on order may "
      "overwrite other arguments",
      [settings](const std::string &value) { load_ini(value, settings); });
  arguments.emplace_back( //
      "--name",           //
      "Host name. Default is the system host name",
      [settings](const std::string &value) {
        settings->name = replace_hostname(value);
      });
  arguments.emplace_back( //
      "--address",        //
      "Local address to announce and bind to. IPv6 uses ff02::fb",
      [settings](const std::string &value) { settings->address = value; });
  arguments.emplace_back( //
      "--service",        //
      "Announces a service. NAME:TYPE:PORT, as `web:_http._tcp:8080`",
      [settings](const std::string &value) {
        settings->services.push_back(parse_service(value));
      });
  arguments.emplace_back( //
      "--browse",         //
      "Browses for a service type and logs the answers",
      [settings](const std::string &value) {
        settings->browse.push_back(settings_t::browse_t{value});
      });
  arguments.emplace_back( //
      "--log-level",      //
      "Log level. debug | info | warning | error",
      [settings](const std::string &value) {
        lanmdns::str_to_log_level(value);
        settings->log_level = value;
      });
  arguments.emplace_back( //
      "--version",        //
      "Show version",
      [](const std::string &value) {
        std::print("lanmdnsd version {}\n", VERSION);
        exit(0);
      },
      false);
  arguments.emplace_back( //
      "--help",           //
      "Show this help",
      [&](const std::string &value) {
        help(arguments);
        exit(0);
      },
      false);
  return arguments;
}

// Parses the argv and sets up the settings_t struct. Throws on invalid
// values.
void parse_argv(const std::vector<std::string> &argv, settings_t *settings) {
  std::vector<argument_t> arguments = setup_arguments(settings);
  // Necesary for two part arguments
  argument_t *current_argument = nullptr;

  for (auto &key : argv) {
    auto parsed = false;
    if (current_argument) {
      current_argument->fn(key);
      parsed = true;
      current_argument = nullptr;
    } else {
      for (auto &argument : arguments) {
        if (argument.has_second_argument) {
          auto keyeq = FMT::format("{}=", argument.arg);
          if (key.substr(0, keyeq.length()) == keyeq) {
            argument.fn(key.substr(keyeq.length()));
            parsed = true;
            break;
          }
        }
        if (key == argument.arg) {
          if (argument.has_second_argument) {
            current_argument = &argument;
          } else {
            argument.fn("");
          }
          parsed = true;
          break;
        }
      }
    }
    if (!parsed) {
      throw lanmdns::exception("Unknown argument: {}. Try help with --help.",
                               key);
    }
  }
  if (current_argument) {
    throw lanmdns::exception("Missing value for {}", current_argument->arg);
  }

  DEBUG("settings after argument parsing: {}", *settings);
}

} // namespace lanmdnsd
