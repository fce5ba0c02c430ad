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

#include <lanmdns/dns_state.hpp>
#include <lanmdns/logger.hpp>
#include <lanmdns/scheduler.hpp>

namespace lanmdns {

dns_state_e dns_state_next(dns_state_e state) {
  switch (state) {
  case PROBING_1:
    return PROBING_2;
  case PROBING_2:
    return PROBING_3;
  case PROBING_3:
    return ANNOUNCING_1;
  case ANNOUNCING_1:
    return ANNOUNCING_2;
  case ANNOUNCING_2:
  case ANNOUNCED:
    return ANNOUNCED;
  case CANCELING_1:
    return CANCELING_2;
  case CANCELING_2:
    return CANCELING_3;
  case CANCELING_3:
  case CANCELED:
    return CANCELED;
  case CLOSING:
  case CLOSED:
    return CLOSED;
  }
  return state;
}

bool is_probing_state(dns_state_e state) {
  return state == PROBING_1 || state == PROBING_2 || state == PROBING_3;
}
bool is_announcing_state(dns_state_e state) {
  return state == ANNOUNCING_1 || state == ANNOUNCING_2;
}
bool is_canceling_state(dns_state_e state) {
  return state == CANCELING_1 || state == CANCELING_2 || state == CANCELING_3;
}

static task_id_t task_id(const dns_task_t *task) {
  return task ? task->get_id() : 0;
}

// Must hold the mutex
void dns_state_machine_t::set_state(dns_state_e next) {
  if (next != state) {
    DEBUG("{}: {} -> {}", name, state, next);
  }
  state = next;
  state_changed.notify_all();
}

bool dns_state_machine_t::is_terminal_bound() const {
  return is_canceling_state(state) || state == CANCELED || state == CLOSING ||
         state == CLOSED;
}

dns_state_e dns_state_machine_t::get_state() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state;
}

bool dns_state_machine_t::advance(const dns_task_t *task) {
  std::lock_guard<std::mutex> lock(mutex);
  auto id = task_id(task);

  bool authoritative = false;
  if (id == 0) {
    authoritative = true;
    for (auto &association : associations) {
      if (association.second == state) {
        authoritative = false;
        break;
      }
    }
  } else {
    auto I = associations.find(id);
    authoritative = I != associations.end() && I->second == state;
  }
  if (!authoritative) {
    return false;
  }

  auto next = dns_state_next(state);
  if (id != 0) {
    associations[id] = next;
  }
  set_state(next);
  return true;
}

bool dns_state_machine_t::revert() {
  std::lock_guard<std::mutex> lock(mutex);
  if (!is_probing_state(state) && !is_announcing_state(state)) {
    return false;
  }
  associations.clear();
  set_state(PROBING_1);
  return true;
}

bool dns_state_machine_t::cancel() {
  std::lock_guard<std::mutex> lock(mutex);
  if (is_terminal_bound()) {
    return false;
  }
  associations.clear();
  set_state(CANCELING_1);
  return true;
}

bool dns_state_machine_t::close() {
  std::lock_guard<std::mutex> lock(mutex);
  if (is_terminal_bound()) {
    return false;
  }
  associations.clear();
  set_state(CLOSING);
  return true;
}

void dns_state_machine_t::recover() {
  std::lock_guard<std::mutex> lock(mutex);
  associations.clear();
  set_state(PROBING_1);
}

bool dns_state_machine_t::associate(const dns_task_t *task,
                                    dns_state_e at_state) {
  std::lock_guard<std::mutex> lock(mutex);
  auto id = task_id(task);
  if (id == 0 || state != at_state) {
    return false;
  }
  for (auto &association : associations) {
    if (association.second == at_state && association.first != id) {
      return false;
    }
  }
  associations[id] = at_state;
  return true;
}

void dns_state_machine_t::disassociate(const dns_task_t *task) {
  std::lock_guard<std::mutex> lock(mutex);
  associations.erase(task_id(task));
}

bool dns_state_machine_t::is_associated(const dns_task_t *task,
                                        dns_state_e at_state) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto I = associations.find(task_id(task));
  return I != associations.end() && I->second == at_state;
}

bool dns_state_machine_t::wait_for_announced(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex);
  // No point waiting once it is going away
  state_changed.wait_for(lock, timeout, [this] {
    return state == ANNOUNCED || is_terminal_bound();
  });
  return state == ANNOUNCED;
}

bool dns_state_machine_t::wait_for_canceled(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex);
  state_changed.wait_for(lock, timeout, [this] { return state == CANCELED; });
  return state == CANCELED;
}

bool dns_state_machine_t::is_probing() const {
  return is_probing_state(get_state());
}
bool dns_state_machine_t::is_announcing() const {
  return is_announcing_state(get_state());
}
bool dns_state_machine_t::is_announced() const {
  return get_state() == ANNOUNCED;
}
bool dns_state_machine_t::is_canceling() const {
  return is_canceling_state(get_state());
}
bool dns_state_machine_t::is_canceled() const {
  return get_state() == CANCELED;
}
bool dns_state_machine_t::is_closing() const { return get_state() == CLOSING; }
bool dns_state_machine_t::is_closed() const { return get_state() == CLOSED; }

std::string dns_state_machine_t::to_string() const {
  std::lock_guard<std::mutex> lock(mutex);
  return FMT::format("{} ({}, {} tasks)", name, state, associations.size());
}

} // namespace lanmdns
