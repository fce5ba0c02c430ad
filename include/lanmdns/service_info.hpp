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
#include "dns_state.hpp"
#include "networkaddress.hpp"
#include "utils.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace lanmdns {
using engine_id_t = uint64_t;

/**
 * @short A name this engine claims on the network, with its records.
 */
class dns_entity_t {
public:
  dns_state_machine_t state;

  explicit dns_entity_t(const std::string &name) : state(name) {}
  virtual ~dns_entity_t() = default;

  // The name probed for
  virtual std::string get_name() const = 0;
  virtual std::vector<record_t> get_records(uint32_t ttl) const = 0;

  // Adds the records answering the question. Nothing unless announced.
  void add_answers(const question_t &question,
                   std::unordered_set<record_t> &answers, uint32_t ttl) const;
  // Someone else claims one of our unique names with other data
  bool is_conflicting(const record_t &record) const;
  question_t get_probe_question() const;
};

class host_info_t : public dns_entity_t {
  std::string name;
  network_address_t address;

public:
  // Name as "myhost.local.", ".local." added when missing
  host_info_t(const std::string &name, const network_address_t &address);

  std::string get_name() const override { return name; }
  const network_address_t &get_address() const { return address; }
  std::vector<record_t> get_records(uint32_t ttl) const override;
};

/**
 * @short A service instance to advertise, as "My Printer._ipp._tcp.local."
 *
 * It only keeps the id of the engine it is registered at. The engine holds
 * the shared pointer in its registry.
 */
class service_info_t : public dns_entity_t {
  std::string type;
  std::string instance_name;
  uint16_t port;
  uint16_t priority;
  uint16_t weight;
  std::vector<std::string> txt;

  std::atomic<engine_id_t> engine{0};
  mutable std::mutex server_mutex;
  std::string server;

public:
  service_info_t(const std::string &type, const std::string &instance_name,
                 uint16_t port, std::vector<std::string> txt = {},
                 uint16_t priority = 0, uint16_t weight = 0);

  // "_http._tcp.local."
  const std::string &get_type() const { return type; }
  std::string get_type_key() const { return to_lower(type); }
  const std::string &get_instance_name() const { return instance_name; }
  std::string get_qualified_name() const { return instance_name + "." + type; }
  // Registry key, case normalized
  std::string get_key() const { return to_lower(get_qualified_name()); }
  uint16_t get_port() const { return port; }
  const std::vector<std::string> &get_txt() const { return txt; }

  engine_id_t get_engine() const { return engine; }
  void set_engine(engine_id_t id) { engine = id; }
  std::string get_server() const;
  void set_server(const std::string &host_name);

  std::string get_name() const override { return get_qualified_name(); }
  std::vector<record_t> get_records(uint32_t ttl) const override;
};

// "_http._tcp" to "_http._tcp.local."
std::string normalize_service_type(const std::string &type);
} // namespace lanmdns
