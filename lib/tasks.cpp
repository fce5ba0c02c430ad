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

#include <lanmdns/engine.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/tasks.hpp>

namespace lanmdns {

/// dns_state_task_t

size_t dns_state_task_t::associate_entities() {
  size_t count = 0;
  for (auto &entity : engine.get_entities()) {
    if (entity->state.associate(this, task_state)) {
      count++;
    }
  }
  return count;
}

std::vector<std::shared_ptr<dns_entity_t>>
dns_state_task_t::associated_entities() const {
  std::vector<std::shared_ptr<dns_entity_t>> ret;
  for (auto &entity : engine.get_entities()) {
    if (entity->state.is_associated(this, task_state)) {
      ret.push_back(entity);
    }
  }
  return ret;
}

void dns_state_task_t::advance_entities(
    const std::vector<std::shared_ptr<dns_entity_t>> &entities) {
  for (auto &entity : entities) {
    if (!entity->state.advance(this)) {
      DEBUG("{} lost {} while running", get_name(), entity->get_name());
    }
  }
}

void dns_state_task_t::remove_associations() {
  for (auto &entity : engine.get_entities()) {
    entity->state.disassociate(this);
  }
}

bool dns_state_task_t::cancel() {
  remove_associations();
  return dns_task_t::cancel();
}

void dns_state_task_t::send_records(
    const std::vector<std::shared_ptr<dns_entity_t>> &entities, uint32_t ttl) {
  outgoing_message_t header(dns_constants::FLAGS_QR_RESPONSE |
                                dns_constants::FLAGS_AA,
                            true, engine.get_config().max_message_size);
  std::vector<record_t> answers;
  for (auto &entity : entities) {
    for (auto &record : entity->get_records(ttl)) {
      answers.push_back(std::move(record));
    }
  }
  for (auto &out : build_messages(header, {}, answers)) {
    engine.send(out);
  }
}

/// prober_t

void prober_t::start() {
  if (associate_entities() == 0) {
    return;
  }
  auto delay = engine.next_probe_delay();
  DEBUG("Start probing in {}ms", delay.count());
  engine.get_scheduler().schedule(STATE_TASKS, shared_from_this(), delay,
                                  engine.get_config().probe_wait);
}

std::string prober_t::get_name() const {
  return FMT::format("prober({}, {})", engine.get_name(), task_state);
}

void prober_t::run() {
  auto entities = associated_entities();
  if (entities.empty()) {
    cancel();
    return;
  }

  outgoing_message_t out(dns_constants::FLAGS_QR_QUERY, true,
                         engine.get_config().max_message_size);
  auto flush = [this, &out]() {
    engine.send(out);
    out = out.fresh();
  };
  for (auto &entity : entities) {
    auto question = entity->get_probe_question();
    if (!out.add_question(question)) {
      flush();
      out.add_question(question);
    }
    for (auto &record : entity->get_records(engine.get_config().ttl)) {
      if (!out.add_authority(record)) {
        flush();
        out.add_authority(record);
      }
    }
  }
  engine.send(out);

  advance_entities(entities);
  task_state = dns_state_next(task_state);
  if (!is_probing_state(task_state)) {
    cancel();
    engine.start_announcer();
  }
}

/// announcer_t

void announcer_t::start() {
  if (associate_entities() == 0) {
    return;
  }
  auto wait = engine.get_config().announce_wait;
  engine.get_scheduler().schedule(STATE_TASKS, shared_from_this(), wait, wait);
}

std::string announcer_t::get_name() const {
  return FMT::format("announcer({}, {})", engine.get_name(), task_state);
}

void announcer_t::run() {
  auto entities = associated_entities();
  if (entities.empty()) {
    cancel();
    return;
  }

  send_records(entities, engine.get_config().ttl);

  advance_entities(entities);
  task_state = dns_state_next(task_state);
  if (!is_announcing_state(task_state)) {
    for (auto &entity : entities) {
      INFO("Announced {}", entity->get_name());
    }
    cancel();
    engine.start_renewer();
  }
}

/// renewer_t

void renewer_t::start() {
  if (associate_entities() == 0) {
    return;
  }
  auto &config = engine.get_config();
  auto interval = config.renew_interval;
  if (interval.count() <= 0) {
    interval = std::chrono::milliseconds(config.ttl * 1000 / 2);
  }
  engine.get_scheduler().schedule(STATE_TASKS, shared_from_this(), interval,
                                  interval);
}

std::string renewer_t::get_name() const {
  return FMT::format("renewer({})", engine.get_name());
}

void renewer_t::run() {
  auto entities = associated_entities();
  if (entities.empty()) {
    cancel();
    return;
  }
  DEBUG("Renewing {} entities", entities.size());
  send_records(entities, engine.get_config().ttl);
  // Stays announced, keeps the association
  advance_entities(entities);
}

/// canceler_t

void canceler_t::start() {
  if (associate_entities() == 0) {
    return;
  }
  engine.get_scheduler().schedule(STATE_TASKS, shared_from_this(),
                                  std::chrono::milliseconds(0),
                                  engine.get_config().announce_wait);
}

std::string canceler_t::get_name() const {
  return FMT::format("canceler({}, {})", engine.get_name(), task_state);
}

void canceler_t::run() {
  auto entities = associated_entities();
  if (entities.empty()) {
    cancel();
    return;
  }

  send_records(entities, 0);

  advance_entities(entities);
  task_state = dns_state_next(task_state);
  if (task_state == CANCELED) {
    cancel();
  }
}

/// service_resolver_t

void service_resolver_t::start() {
  auto wait = engine.get_config().query_wait;
  engine.get_scheduler().schedule(QUERY_TASKS, shared_from_this(), wait, wait);
}

std::string service_resolver_t::get_name() const {
  return FMT::format("service_resolver({}, {})", engine.get_name(), type);
}

void service_resolver_t::run() {
  if (count++ >= engine.get_config().resolver_queries) {
    cancel();
    return;
  }
  outgoing_message_t out(dns_constants::FLAGS_QR_QUERY, true,
                         engine.get_config().max_message_size);
  out.add_question(question_t(type, TYPE_PTR));
  engine.send(out);
}

} // namespace lanmdns
