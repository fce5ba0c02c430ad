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

#include "./test_case.hpp"
#include "./test_utils.hpp"
#include <atomic>
#include <lanmdns/exceptions.hpp>
#include <lanmdns/scheduler.hpp>
#include <mutex>
#include <thread>

using namespace lanmdns;
using namespace std::chrono_literals;

// Runs are logged into a shared list
class log_task_t : public dns_task_t {
public:
  std::string name;
  std::mutex *mutex;
  std::vector<std::string> *log;
  int max_runs;
  std::atomic<int> runs{0};

  log_task_t(const std::string &name, std::mutex *mutex,
             std::vector<std::string> *log, int max_runs = 1)
      : name(name), mutex(mutex), log(log), max_runs(max_runs) {}

  std::string get_name() const override { return name; }
  void run() override {
    {
      std::lock_guard<std::mutex> lock(*mutex);
      log->push_back(name);
    }
    if (++runs >= max_runs) {
      cancel();
    }
  }
};

class throwing_task_t : public dns_task_t {
public:
  std::string get_name() const override { return "throwing"; }
  void run() override { throw exception("Something went wrong"); }
};

void test_run_in_order() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  scheduler.schedule(QUERY_TASKS,
                     std::make_shared<log_task_t>("late", &mutex, &log), 50ms);
  scheduler.schedule(QUERY_TASKS,
                     std::make_shared<log_task_t>("first", &mutex, &log), 0ms);
  scheduler.schedule(STATE_TASKS,
                     std::make_shared<log_task_t>("second", &mutex, &log),
                     0ms);
  scheduler.schedule(QUERY_TASKS,
                     std::make_shared<log_task_t>("middle", &mutex, &log),
                     20ms);

  ASSERT_TRUE(wait_until(
      [&] {
        std::lock_guard<std::mutex> lock(mutex);
        return log.size() == 4;
      },
      2000ms));

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQUAL(log[0], "first");
  ASSERT_EQUAL(log[1], "second");
  ASSERT_EQUAL(log[2], "middle");
  ASSERT_EQUAL(log[3], "late");
}

void test_periodic_until_canceled() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  auto task = std::make_shared<log_task_t>("periodic", &mutex, &log, 3);
  scheduler.schedule(STATE_TASKS, task, 0ms, 5ms);

  ASSERT_TRUE(wait_until([&] { return task->runs == 3; }, 2000ms));
  std::this_thread::sleep_for(30ms);
  ASSERT_EQUAL(task->runs.load(), 3);
  ASSERT_EQUAL(scheduler.pending(STATE_TASKS), 0);
}

void test_purge_keeps_accepting() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  auto periodic = std::make_shared<log_task_t>("periodic", &mutex, &log, 1000);
  ASSERT_TRUE(scheduler.schedule(STATE_TASKS, periodic, 0ms, 5ms));
  ASSERT_TRUE(scheduler.schedule(
      QUERY_TASKS, std::make_shared<log_task_t>("query", &mutex, &log), 1000ms));
  ASSERT_TRUE(wait_until([&] { return periodic->runs >= 2; }, 2000ms));

  scheduler.purge_state_timer();
  std::this_thread::sleep_for(20ms);
  int runs = periodic->runs;
  std::this_thread::sleep_for(30ms);
  // At most the one running while purging
  ASSERT_LTE(periodic->runs.load(), runs + 1);
  ASSERT_EQUAL(scheduler.pending(STATE_TASKS), 0);
  // Purged tasks are canceled, so they release what they hold
  ASSERT_TRUE(wait_until([&] { return periodic->is_canceled(); }, 2000ms));
  // Other group untouched
  ASSERT_EQUAL(scheduler.pending(QUERY_TASKS), 1);

  auto again = std::make_shared<log_task_t>("again", &mutex, &log);
  ASSERT_TRUE(scheduler.schedule(STATE_TASKS, again, 0ms));
  ASSERT_TRUE(wait_until([&] { return again->runs == 1; }, 2000ms));
}

void test_cancel_refuses_new_tasks() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  auto query = std::make_shared<log_task_t>("query", &mutex, &log);
  ASSERT_TRUE(scheduler.schedule(QUERY_TASKS, query, 20ms));
  scheduler.cancel_timer();
  ASSERT_EQUAL(scheduler.pending(QUERY_TASKS), 0);
  ASSERT_TRUE(query->is_canceled());
  ASSERT_FALSE(scheduler.schedule(
      QUERY_TASKS, std::make_shared<log_task_t>("late", &mutex, &log), 0ms));
  // State tasks still run
  auto state = std::make_shared<log_task_t>("state", &mutex, &log);
  ASSERT_TRUE(scheduler.schedule(STATE_TASKS, state, 0ms));
  ASSERT_TRUE(wait_until([&] { return state->runs == 1; }, 2000ms));

  std::this_thread::sleep_for(40ms);
  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQUAL(log.size(), 1);
  ASSERT_EQUAL(log[0], "state");
}

void test_exceptions_do_not_stop_the_thread() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  scheduler.schedule(QUERY_TASKS, std::make_shared<throwing_task_t>(), 0ms,
                     5ms);
  auto after = std::make_shared<log_task_t>("after", &mutex, &log);
  scheduler.schedule(QUERY_TASKS, after, 10ms);
  ASSERT_TRUE(wait_until([&] { return after->runs == 1; }, 2000ms));
}

void test_dispose() {
  std::mutex mutex;
  std::vector<std::string> log;
  task_scheduler_t scheduler("test");

  auto task = std::make_shared<log_task_t>("never", &mutex, &log);
  scheduler.schedule(QUERY_TASKS, task, 50ms);
  scheduler.dispose();
  ASSERT_TRUE(scheduler.is_disposed());
  ASSERT_FALSE(scheduler.schedule(QUERY_TASKS, task, 0ms));
  std::this_thread::sleep_for(80ms);
  ASSERT_EQUAL(task->runs.load(), 0);
  // Twice is fine
  scheduler.dispose();
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_run_in_order),
      TEST(test_periodic_until_canceled),
      TEST(test_purge_keeps_accepting),
      TEST(test_cancel_refuses_new_tasks),
      TEST(test_exceptions_do_not_stop_the_thread),
      TEST(test_dispose),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
