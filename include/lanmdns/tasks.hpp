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
#include "scheduler.hpp"
#include "service_info.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lanmdns {
class mdns_engine_t;

/**
 * @short A task driving the entities associated to it along their states.
 *
 * At start it associates every entity of the engine that is in the task
 * state and not driven by anybody else. Each run only touches the entities
 * still associated, so a revert or a cancel quietly leaves it out.
 */
class dns_state_task_t : public dns_task_t {
protected:
  mdns_engine_t &engine;
  dns_state_e task_state;

  // Returns how many got associated
  size_t associate_entities();
  std::vector<std::shared_ptr<dns_entity_t>> associated_entities() const;
  void advance_entities(
      const std::vector<std::shared_ptr<dns_entity_t>> &entities);
  void remove_associations();
  // Multicast all the records of the entities
  void send_records(const std::vector<std::shared_ptr<dns_entity_t>> &entities,
                    uint32_t ttl);

public:
  dns_state_task_t(mdns_engine_t &engine, dns_state_e state)
      : engine(engine), task_state(state) {}

  bool cancel() override;
  dns_state_e get_task_state() const { return task_state; }
};

class prober_t : public dns_state_task_t {
public:
  explicit prober_t(mdns_engine_t &engine)
      : dns_state_task_t(engine, PROBING_1) {}
  void start();
  std::string get_name() const override;
  void run() override;
};

class announcer_t : public dns_state_task_t {
public:
  explicit announcer_t(mdns_engine_t &engine)
      : dns_state_task_t(engine, ANNOUNCING_1) {}
  void start();
  std::string get_name() const override;
  void run() override;
};

class renewer_t : public dns_state_task_t {
public:
  explicit renewer_t(mdns_engine_t &engine)
      : dns_state_task_t(engine, ANNOUNCED) {}
  void start();
  std::string get_name() const override;
  void run() override;
};

class canceler_t : public dns_state_task_t {
public:
  explicit canceler_t(mdns_engine_t &engine)
      : dns_state_task_t(engine, CANCELING_1) {}
  void start();
  std::string get_name() const override;
  void run() override;
};

/**
 * @short Answers one query, after a random delay.
 *
 * Queries from a port other than 5353 get a direct unicast answer that
 * repeats the questions.
 */
class responder_t : public dns_task_t {
  mdns_engine_t &engine;
  incoming_message_t in;
  network_address_t from;
  bool unicast;

public:
  responder_t(mdns_engine_t &engine, incoming_message_t in,
              const network_address_t &from);
  void start();
  std::string get_name() const override;
  void run() override;
  bool is_unicast() const { return unicast; }
};

/// Asks for the instances of a service type a few times
class service_resolver_t : public dns_task_t {
  mdns_engine_t &engine;
  std::string type;
  int count = 0;

public:
  service_resolver_t(mdns_engine_t &engine, const std::string &type)
      : engine(engine), type(normalize_service_type(type)) {}
  void start();
  std::string get_name() const override;
  void run() override;
};
} // namespace lanmdns
