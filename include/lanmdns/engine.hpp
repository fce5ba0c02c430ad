/**
 * lanmdns - Multicast DNS service discovery engine
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#pragma once
#include "dns.hpp"
#include "executor.hpp"
#include "random.hpp"
#include "scheduler.hpp"
#include "service_info.hpp"
#include "transport.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace lanmdns {

/// Protocol timings and limits. Defaults are the standard values; tests
/// shorten them.
struct engine_config_t {
  // Host name, ".local." is added when missing
  std::string name = "lanmdns";
  uint32_t ttl = dns_constants::DNS_TTL;
  size_t max_message_size = dns_constants::MAX_MSG_TYPICAL;

  std::chrono::milliseconds probe_wait = dns_constants::PROBE_WAIT;
  std::chrono::milliseconds probe_conflict_interval =
      dns_constants::PROBE_CONFLICT_INTERVAL;
  std::chrono::milliseconds probe_throttle_interval =
      dns_constants::PROBE_THROTTLE_INTERVAL;
  int probe_throttle_count = dns_constants::PROBE_THROTTLE_COUNT;
  std::chrono::milliseconds announce_wait = dns_constants::ANNOUNCE_WAIT;
  std::chrono::milliseconds response_min_wait =
      dns_constants::RESPONSE_MIN_WAIT;
  std::chrono::milliseconds response_max_wait =
      dns_constants::RESPONSE_MAX_WAIT;
  std::chrono::milliseconds query_wait = dns_constants::QUERY_WAIT;
  std::chrono::milliseconds close_timeout = dns_constants::CLOSE_TIMEOUT;
  int resolver_queries = 3;
  // 0 for ttl / 2
  std::chrono::milliseconds renew_interval{0};
};

/// Gets all the answers of a received response naming its service type.
/// Runs at the listener executor.
class answer_listener_t {
public:
  virtual ~answer_listener_t() = default;
  virtual void answers_received(const std::vector<record_t> &answers) = 0;
};

/**
 * @short The discovery engine: one multicast channel, one scheduler, one
 * host name and the services registered on it.
 *
 * Engines are independent of each other. All incoming messages are
 * processed one at a time under the io mutex.
 *
 * A fatal error on the channel cancels everything, rebuilds the channel and
 * registers again the same services. See recover().
 */
class mdns_engine_t {
  NON_COPYABLE_NOR_MOVABLE(mdns_engine_t)

  static std::atomic<engine_id_t> next_id;
  const engine_id_t id;
  engine_config_t config;
  std::shared_ptr<random_t> random;
  transport_factory_t transport_factory;
  std::shared_ptr<host_info_t> local_host;

  mutable std::mutex services_mutex;
  std::map<std::string, std::shared_ptr<service_info_t>> services;

  mutable std::mutex listeners_mutex;
  std::map<std::string, std::vector<std::shared_ptr<answer_listener_t>>>
      answer_listeners;

  std::mutex io_mutex;
  mutable std::mutex transport_mutex;
  std::shared_ptr<transport_t> transport;

  std::mutex recover_mutex;
  std::thread recovery_thread;
  // Set once by close(). Under recover_mutex.
  bool closing = false;

  std::mutex throttle_mutex;
  int throttle = 0;
  std::chrono::steady_clock::time_point last_throttle_increment;

  task_scheduler_t scheduler;
  executor_t listener_executor;

  void open_multicast_socket();
  void close_multicast_socket();
  void start(const std::vector<std::shared_ptr<service_info_t>> &services);
  void data_ready(io_bytes_reader &data, const network_address_t &from);
  void transport_error(int errno_);
  void run_recovery();
  void join_recovery();
  void send_goodbye(const dns_entity_t &entity);
  void cancel_services(
      const std::vector<std::shared_ptr<service_info_t>> &snapshot);
  bool check_conflicts(const std::vector<record_t> &answers);
  void dispatch_answers(const std::vector<record_t> &answers);

public:
  // Opens the channel and starts probing the host name. Throws
  // network_exception if the channel can not be opened.
  mdns_engine_t(const engine_config_t &config,
                const network_address_t &address,
                transport_factory_t transport_factory,
                std::shared_ptr<random_t> random);
  ~mdns_engine_t();

  /// Registration. Throws illegal_state_exception on contract violations.
  void register_service(const std::shared_ptr<service_info_t> &info);
  void unregister_service(const std::shared_ptr<service_info_t> &info);
  void unregister_all_services();
  std::vector<std::shared_ptr<service_info_t>> get_services() const;
  std::shared_ptr<service_info_t> get_service(const std::string &key) const;

  // Types as in service_info_t, "_ipp._tcp" or "_ipp._tcp.local.". Throws
  // exception on invalid types.
  void add_answer_listener(const std::string &type,
                           const std::shared_ptr<answer_listener_t> &listener);
  void start_service_resolver(const std::string &type);

  /// Network path
  void handle_query(const incoming_message_t &msg,
                    const network_address_t &from);
  void handle_response(const incoming_message_t &msg);
  void send(const outgoing_message_t &out);

  void recover();
  void close();

  /// For the tasks
  void start_prober();
  void start_announcer();
  void start_renewer();
  void start_canceler();
  void start_responder(const incoming_message_t &msg,
                       const network_address_t &from);
  std::chrono::milliseconds next_probe_delay();
  // Host first, then the registered services
  std::vector<std::shared_ptr<dns_entity_t>> get_entities() const;
  void add_answers(const question_t &question,
                   std::unordered_set<record_t> &answers) const;

  engine_id_t get_id() const { return id; }
  const std::string &get_name() const { return config.name; }
  const engine_config_t &get_config() const { return config; }
  random_t &get_random() { return *random; }
  task_scheduler_t &get_scheduler() { return scheduler; }
  host_info_t &get_local_host() { return *local_host; }
  bool is_transport_open() const;
};
} // namespace lanmdns
