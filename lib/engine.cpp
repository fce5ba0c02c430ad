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

#include <algorithm>
#include <lanmdns/engine.hpp>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/tasks.hpp>

namespace lanmdns {

std::atomic<engine_id_t> mdns_engine_t::next_id{1};

mdns_engine_t::mdns_engine_t(const engine_config_t &config_,
                             const network_address_t &address,
                             transport_factory_t transport_factory_,
                             std::shared_ptr<random_t> random_)
    : id(next_id++), config(config_), random(std::move(random_)),
      transport_factory(std::move(transport_factory_)),
      local_host(std::make_shared<host_info_t>(config_.name, address)),
      scheduler(FMT::format("scheduler-{}", id)),
      listener_executor(FMT::format("listeners-{}", id)) {
  config.name = local_host->get_name();
  if (!random) {
    random = std::make_shared<random_t>();
  }
  INFO("Starting mDNS engine {} for {} at {}", id, config.name, address.ip());
  open_multicast_socket();
  start({});
}

mdns_engine_t::~mdns_engine_t() {
  close();
  join_recovery();
}

void mdns_engine_t::start(
    const std::vector<std::shared_ptr<service_info_t>> &to_register) {
  start_prober();
  for (auto &info : to_register) {
    try {
      register_service(info);
    } catch (const illegal_state_exception &e) {
      ERROR("Could not register again {}: {}", info->get_name(), e.what());
    }
  }
}

/// Registries

void mdns_engine_t::register_service(
    const std::shared_ptr<service_info_t> &info) {
  if (local_host->state.is_closing() || local_host->state.is_closed()) {
    throw illegal_state_exception("Engine {} is closed. Can not register {}",
                                  config.name, info->get_name());
  }
  auto bound = info->get_engine();
  if (bound != 0 && bound != id) {
    throw illegal_state_exception(
        "Service {} is registered at another engine ({})", info->get_name(),
        bound);
  }

  auto key = info->get_key();
  {
    std::lock_guard<std::mutex> lock(services_mutex);
    if (services.find(key) != services.end()) {
      throw illegal_state_exception("Service {} is already registered",
                                    info->get_name());
    }
    info->set_engine(id);
    info->state.recover();
    info->set_server(local_host->get_name());
    services.emplace(key, info);
  }
  INFO("Registered service {} port {}", info->get_name(), info->get_port());
  start_prober();
}

void mdns_engine_t::unregister_service(
    const std::shared_ptr<service_info_t> &info) {
  auto key = info->get_key();
  {
    std::lock_guard<std::mutex> lock(services_mutex);
    auto I = services.find(key);
    if (I == services.end() || I->second != info) {
      DEBUG("Service {} is not registered here", info->get_name());
      return;
    }
  }

  info->state.cancel();
  start_canceler();
  if (!info->state.wait_for_canceled(config.close_timeout)) {
    WARNING("Timeout waiting for {} to be canceled", info->get_name());
  }

  std::lock_guard<std::mutex> lock(services_mutex);
  auto I = services.find(key);
  if (I != services.end() && I->second == info) {
    services.erase(I);
  }
  INFO("Unregistered service {}", info->get_name());
}

void mdns_engine_t::unregister_all_services() {
  cancel_services(get_services());
}

void mdns_engine_t::cancel_services(
    const std::vector<std::shared_ptr<service_info_t>> &snapshot) {
  for (auto &info : snapshot) {
    info->state.cancel();
  }
  start_canceler();
  for (auto &info : snapshot) {
    if (!info->state.wait_for_canceled(config.close_timeout)) {
      WARNING("Timeout waiting for {} to be canceled", info->get_name());
    }
  }

  std::lock_guard<std::mutex> lock(services_mutex);
  for (auto &info : snapshot) {
    auto I = services.find(info->get_key());
    if (I != services.end() && I->second == info) {
      services.erase(I);
    }
  }
  DEBUG("Unregistered {} services", snapshot.size());
}

std::vector<std::shared_ptr<service_info_t>>
mdns_engine_t::get_services() const {
  std::lock_guard<std::mutex> lock(services_mutex);
  std::vector<std::shared_ptr<service_info_t>> ret;
  ret.reserve(services.size());
  for (auto &service : services) {
    ret.push_back(service.second);
  }
  return ret;
}

std::shared_ptr<service_info_t>
mdns_engine_t::get_service(const std::string &key) const {
  std::lock_guard<std::mutex> lock(services_mutex);
  auto I = services.find(to_lower(key));
  if (I == services.end()) {
    return nullptr;
  }
  return I->second;
}

std::vector<std::shared_ptr<dns_entity_t>> mdns_engine_t::get_entities() const {
  std::vector<std::shared_ptr<dns_entity_t>> ret;
  ret.push_back(local_host);
  std::lock_guard<std::mutex> lock(services_mutex);
  for (auto &service : services) {
    ret.push_back(service.second);
  }
  return ret;
}

void mdns_engine_t::add_answers(const question_t &question,
                                std::unordered_set<record_t> &answers) const {
  for (auto &entity : get_entities()) {
    entity->add_answers(question, answers, config.ttl);
  }
}

void mdns_engine_t::add_answer_listener(
    const std::string &type, const std::shared_ptr<answer_listener_t> &listener) {
  auto key = to_lower(normalize_service_type(type));
  std::lock_guard<std::mutex> lock(listeners_mutex);
  auto &listeners = answer_listeners[key];
  if (std::find(listeners.begin(), listeners.end(), listener) !=
      listeners.end()) {
    return;
  }
  listeners.push_back(listener);
  DEBUG("Listening for answers of {} ({} listeners)", key, listeners.size());
}

/// Tasks

void mdns_engine_t::start_prober() {
  std::make_shared<prober_t>(*this)->start();
}

void mdns_engine_t::start_announcer() {
  std::make_shared<announcer_t>(*this)->start();
}

void mdns_engine_t::start_renewer() {
  std::make_shared<renewer_t>(*this)->start();
}

void mdns_engine_t::start_canceler() {
  std::make_shared<canceler_t>(*this)->start();
}

void mdns_engine_t::start_responder(const incoming_message_t &msg,
                                    const network_address_t &from) {
  std::make_shared<responder_t>(*this, msg, from)->start();
}

void mdns_engine_t::start_service_resolver(const std::string &type) {
  std::make_shared<service_resolver_t>(*this, type)->start();
}

std::chrono::milliseconds mdns_engine_t::next_probe_delay() {
  std::lock_guard<std::mutex> lock(throttle_mutex);
  auto now = std::chrono::steady_clock::now();
  if (now - last_throttle_increment < config.probe_throttle_interval) {
    throttle++;
  } else {
    throttle = 1;
  }
  last_throttle_increment = now;

  if (throttle < config.probe_throttle_count) {
    return std::chrono::milliseconds(
        random->next_int(int(config.probe_wait.count())));
  }
  WARNING_RATE_LIMIT(10, "Too many probes ({}). Throttling.", throttle);
  return config.probe_conflict_interval;
}

/// Network path

void mdns_engine_t::data_ready(io_bytes_reader &data,
                               const network_address_t &from) {
  incoming_message_t msg;
  try {
    msg = incoming_message_t::parse(data);
  } catch (const protocol_exception &e) {
    WARNING_RATE_LIMIT(10, "Dropping malformed packet from {}: {}",
                       from.to_string(), e.what());
    return;
  }

  if (msg.is_query()) {
    handle_query(msg, from);
  } else {
    handle_response(msg);
  }
}

void mdns_engine_t::handle_query(const incoming_message_t &msg,
                                 const network_address_t &from) {
  std::lock_guard<std::mutex> lock(io_mutex);
  start_responder(msg, from);
}

void mdns_engine_t::handle_response(const incoming_message_t &msg) {
  std::lock_guard<std::mutex> lock(io_mutex);
  auto answers = address_records_last(msg.answers);

  if (check_conflicts(answers)) {
    start_prober();
  }
  dispatch_answers(answers);
}

// Returns true if any entity went back to probing
bool mdns_engine_t::check_conflicts(const std::vector<record_t> &answers) {
  bool reverted = false;
  for (auto &entity : get_entities()) {
    if (!entity->state.is_probing() && !entity->state.is_announcing()) {
      continue;
    }
    for (auto &record : answers) {
      if (entity->is_conflicting(record)) {
        if (entity->state.revert()) {
          WARNING("Name conflict for {} with {}. Probing again.",
                  entity->get_name(), record);
          reverted = true;
        }
        break;
      }
    }
  }
  return reverted;
}

void mdns_engine_t::dispatch_answers(const std::vector<record_t> &answers) {
  std::vector<std::string> types;
  for (auto &record : answers) {
    if (record.type != TYPE_PTR) {
      continue;
    }
    auto key = record.key();
    if (std::find(types.begin(), types.end(), key) == types.end()) {
      types.push_back(key);
    }
  }

  for (auto &type : types) {
    std::vector<std::shared_ptr<answer_listener_t>> listeners;
    {
      std::lock_guard<std::mutex> lock(listeners_mutex);
      auto I = answer_listeners.find(type);
      if (I == answer_listeners.end()) {
        continue;
      }
      listeners = I->second;
    }
    for (auto &listener : listeners) {
      listener_executor.submit(
          [listener, answers]() { listener->answers_received(answers); });
    }
  }
}

void mdns_engine_t::send(const outgoing_message_t &out) {
  if (out.is_empty()) {
    return;
  }
  std::shared_ptr<transport_t> current;
  {
    std::lock_guard<std::mutex> lock(transport_mutex);
    current = transport;
  }
  if (!current || !current->is_open()) {
    DEBUG("Channel closed, not sending {}", out);
    return;
  }

  auto data = out.serialize();
  auto to = out.destination.value_or(current->get_group_address());
  try {
    current->send_to(data, to);
  } catch (const network_exception &e) {
    if (e.is_fatal()) {
      ERROR("Error sending to {}: {}. Recovering.", to.to_string(), e.what());
      recover();
      return;
    }
    WARNING_RATE_LIMIT(10, "Error sending to {}. This is UDP... so just lost! ({})",
                       to.to_string(), e.what());
  }
}

bool mdns_engine_t::is_transport_open() const {
  std::lock_guard<std::mutex> lock(transport_mutex);
  return transport && transport->is_open();
}

} // namespace lanmdns
