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
#include <lanmdns/engine.hpp>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/poller.hpp>
#include <memory>
#include <signal.h>
#include <unistd.h>

namespace lanmdnsd {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
settings_t settings;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
lanmdns::poller_t poller;
} // namespace lanmdnsd

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static bool exiting = false;

void sigterm_f(int) {
  if (exiting) {
    exit(1);
  }
  exiting = true;
  INFO("SIGTERM received. Closing.");
  lanmdnsd::poller.close();
}
void sigint_f(int) {
  if (exiting) {
    exit(1);
  }
  exiting = true;
  INFO("SIGINT received. Closing.");
  lanmdnsd::poller.close();
}

/// Logs whatever is found for a browsed type
class browse_logger_t : public lanmdns::answer_listener_t {
  std::string type;

public:
  explicit browse_logger_t(const std::string &type) : type(type) {}

  void answers_received(const std::vector<lanmdns::record_t> &answers) override {
    for (auto &answer : answers) {
      INFO("{}: {}", type, answer);
    }
  }
};

class main_t {
protected:
  std::unique_ptr<lanmdns::mdns_engine_t> engine;
  std::vector<std::shared_ptr<lanmdns::service_info_t>> services;

public:
  // I want setup inside a try catch (and survive it), so I need a setup method
  void setup() {
    auto &settings = lanmdnsd::settings;
    auto address = settings.address.empty()
                       ? lanmdns::network_address_t::find_local_address()
                       : lanmdns::network_address_t::from_string(
                             settings.address, 0);

    lanmdns::engine_config_t config;
    config.name =
        settings.name.empty() ? lanmdnsd::get_hostname() : settings.name;

    engine = std::make_unique<lanmdns::mdns_engine_t>(
        config, address,
        [address]() {
          return std::make_unique<lanmdns::multicast_socket_t>(address);
        },
        std::make_shared<lanmdns::random_t>());

    setup_services();
    setup_browse();
  }

  void close() {
    if (engine) {
      engine->close();
    }
    engine.reset();
  }

protected:
  void setup_services() {
    for (const auto &service : lanmdnsd::settings.services) {
      auto info = std::make_shared<lanmdns::service_info_t>(
          service.type, service.name, service.port, service.txt,
          service.priority, service.weight);
      engine->register_service(info);
      services.push_back(info);
    }
  }

  void setup_browse() {
    for (const auto &browse : lanmdnsd::settings.browse) {
      engine->add_answer_listener(
          browse.type, std::make_shared<browse_logger_t>(browse.type));
      engine->start_service_resolver(browse.type);
    }
  }
};

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.push_back(argv[i]);
  }

  try {
    lanmdnsd::parse_argv(args, &lanmdnsd::settings);
    lanmdns::logger2.set_log_level(
        lanmdns::str_to_log_level(lanmdnsd::settings.log_level));
  } catch (const lanmdns::exception &exc) {
    ERROR("{}", exc.what());
    return 1;
  }

  signal(SIGINT, sigint_f);
  signal(SIGTERM, sigterm_f);

  main_t maindata;

  // SETUP
  try {
    maindata.setup();
  } catch (const std::exception &exc) {
    ERROR("Error on setup: {}", exc.what());
    maindata.close();
    return 1;
  }

  // MAIN RUN
  try {
    INFO("Running. Ctrl-C to exit.");
    while (lanmdnsd::poller.is_open()) {
      lanmdnsd::poller.wait();
    }
  } catch (const std::exception &exc) {
    ERROR("Unhandled exception: {}!", exc.what());
  }

  maindata.close();

  INFO("FIN");
  return 0;
}
