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
#include <lanmdns/logger.hpp>
#include <lanmdns/scheduler.hpp>

namespace lanmdns {

std::atomic<task_id_t> dns_task_t::next_id{1};

bool dns_task_t::cancel() { return !canceled.exchange(true); }

task_scheduler_t::task_scheduler_t(std::string name_) : name(std::move(name_)) {
  thread = std::thread([this] { run_loop(); });
}

task_scheduler_t::~task_scheduler_t() { dispose(); }

void task_scheduler_t::insert_event(timer_event_t &&event) {
  // After any other with the same time, so equal times run in FIFO order
  auto I = std::upper_bound(
      timer_events.begin(), timer_events.end(), event.when,
      [](const auto &when, const auto &b) { return when < b.when; });
  timer_events.insert(I, std::move(event));
}

bool task_scheduler_t::schedule(task_group_e group,
                                std::shared_ptr<dns_task_t> task,
                                std::chrono::milliseconds delay,
                                std::chrono::milliseconds period) {
  std::unique_lock<std::mutex> lock(mutex);
  if (disposed || groups[group].canceled) {
    DEBUG("{}: not scheduling {}, {} group is canceled", name,
          task->get_name(), group);
    return false;
  }
  auto when = std::chrono::steady_clock::now() +
              std::max(delay, std::chrono::milliseconds(0));
  insert_event(timer_event_t{when, period, max_timer_id++, group,
                             groups[group].generation, std::move(task)});
  wakeup.notify_all();
  return true;
}

// Must hold the mutex. Returns the dropped tasks, to be canceled out of it.
std::vector<std::shared_ptr<dns_task_t>>
task_scheduler_t::drop_group(task_group_e group) {
  groups[group].generation++;
  std::vector<std::shared_ptr<dns_task_t>> dropped;
  auto I = std::stable_partition(
      timer_events.begin(), timer_events.end(),
      [group](const auto &event) { return event.group != group; });
  for (auto J = I; J != timer_events.end(); ++J) {
    dropped.push_back(std::move(J->task));
  }
  timer_events.erase(I, timer_events.end());
  return dropped;
}

// Dropped tasks never run again, so they let go of their entities
static void cancel_tasks(const std::vector<std::shared_ptr<dns_task_t>> &tasks,
                         const std::string &name) {
  for (auto &task : tasks) {
    if (task->cancel()) {
      DEBUG("{}: dropped {}", name, task->get_name());
    }
  }
}

void task_scheduler_t::cancel_group(task_group_e group) {
  std::vector<std::shared_ptr<dns_task_t>> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex);
    groups[group].canceled = true;
    dropped = drop_group(group);
    wakeup.notify_all();
  }
  cancel_tasks(dropped, name);
}

void task_scheduler_t::purge_group(task_group_e group) {
  std::vector<std::shared_ptr<dns_task_t>> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex);
    dropped = drop_group(group);
    wakeup.notify_all();
  }
  cancel_tasks(dropped, name);
}

void task_scheduler_t::run_loop() {
  std::unique_lock<std::mutex> lock(mutex);
  while (!disposed) {
    if (timer_events.empty()) {
      wakeup.wait(lock);
      continue;
    }
    auto now = std::chrono::steady_clock::now();
    if (timer_events.front().when > now) {
      wakeup.wait_until(lock, timer_events.front().when);
      continue;
    }

    auto event = std::move(timer_events.front());
    timer_events.erase(timer_events.begin());
    if (event.task->is_canceled()) {
      continue;
    }

    lock.unlock();
    try {
      event.task->run();
    } catch (const std::exception &e) {
      ERROR("{}: exception running task {}: {}", name, event.task->get_name(),
            e.what());
    } catch (...) {
      ERROR("{}: unknown exception running task {}", name,
            event.task->get_name());
    }
    lock.lock();

    if (event.period.count() == 0 || event.task->is_canceled() || disposed) {
      continue;
    }
    if (!groups[event.group].canceled &&
        groups[event.group].generation == event.generation) {
      event.when += event.period;
      insert_event(std::move(event));
    } else {
      // Purged while running
      lock.unlock();
      cancel_tasks({event.task}, name);
      lock.lock();
    }
  }
  timer_events.clear();
}

void task_scheduler_t::dispose() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (disposed && !thread.joinable()) {
      return;
    }
    disposed = true;
    wakeup.notify_all();
  }
  if (!thread.joinable()) {
    return;
  }
  if (is_timer_thread()) {
    WARNING("{}: disposed from its own timer thread. Detaching.", name);
    thread.detach();
    return;
  }
  thread.join();
  DEBUG("{}: timer thread stopped", name);
}

bool task_scheduler_t::is_disposed() const {
  std::lock_guard<std::mutex> lock(mutex);
  return disposed;
}

bool task_scheduler_t::is_timer_thread() const {
  return std::this_thread::get_id() == thread.get_id();
}

size_t task_scheduler_t::pending(task_group_e group) const {
  std::lock_guard<std::mutex> lock(mutex);
  return std::count_if(
      timer_events.begin(), timer_events.end(),
      [group](const auto &event) { return event.group == group; });
}

} // namespace lanmdns
