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
#include <errno.h>
#include <lanmdns/engine.hpp>
#include <lanmdns/exceptions.hpp>
#include <atomic>
#include <thread>
#include <unordered_set>

using namespace lanmdns;
using namespace std::chrono_literals;

static const auto LOCAL = network_address_t::from_string("192.168.1.10", 0);
static const auto QUERIER =
    network_address_t::from_string("192.168.1.50", 40000);
static const auto PEER =
    network_address_t::from_string("192.168.1.60", dns_constants::MDNS_PORT);
static const std::string WEB = "web._http._tcp.local.";

static std::unique_ptr<mdns_engine_t>
make_engine(const std::shared_ptr<fake_network_t> &network,
            const engine_config_t &config) {
  return std::make_unique<mdns_engine_t>(config, LOCAL, network->factory(),
                                         std::make_shared<random_t>(42));
}

// Probes are queries asking for the name
static int count_probes(const std::vector<sent_packet_t> &sent,
                        const std::string &name) {
  int count = 0;
  for (auto &packet : sent) {
    auto msg = packet.parse();
    if (!msg.is_query()) {
      continue;
    }
    for (auto &question : msg.questions) {
      if (equal_ignore_case(question.name, name)) {
        count++;
      }
    }
  }
  return count;
}

void test_register_announce_and_answer() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto info = std::make_shared<service_info_t>("_http._tcp", "web", 8080,
                                               std::vector<std::string>{"a=1"});
  engine->register_service(info);

  ASSERT_TRUE(info->state.wait_for_announced(2000ms));
  ASSERT_EQUAL(info->get_server(), "myhost.local.");
  auto sent = network->get_sent();
  ASSERT_GTE(count_probes(sent, WEB), 3);
  ASSERT_GTE(count_sent_records(sent, TYPE_SRV, WEB), 2);
  network->clear_sent();

  outgoing_message_t query(dns_constants::FLAGS_QR_QUERY, false);
  query.id = 1;
  query.add_question(question_t("_http._tcp.local.", TYPE_PTR));
  network->inject(query, QUERIER);

  ASSERT_TRUE(network->wait_for(
      [](const std::vector<sent_packet_t> &sent) { return !sent.empty(); },
      2000ms));
  std::this_thread::sleep_for(50ms);
  sent = network->get_sent();
  ASSERT_EQUAL(sent.size(), 1);
  ASSERT_TRUE(sent[0].to == QUERIER);
  auto msg = sent[0].parse();
  ASSERT_TRUE(msg.is_response());
  ASSERT_EQUAL(msg.questions.size(), 1);
  ASSERT_EQUAL(msg.questions[0].name, "_http._tcp.local.");
  ASSERT_EQUAL(msg.answers.size(), 1);
  ASSERT_EQUAL(std::get<record_ptr_t>(msg.answers[0].data).alias, WEB);

  engine->close();
}

void test_recover_from_receive_error() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto info = std::make_shared<service_info_t>("_http._tcp", "web", 8080);
  engine->register_service(info);
  ASSERT_TRUE(info->state.wait_for_announced(2000ms));
  ASSERT_TRUE(engine->get_local_host().state.wait_for_announced(2000ms));
  network->clear_sent();

  network->fail(ENETDOWN);

  // Goodbyes for everything, then a new channel
  ASSERT_TRUE(network->wait_for(
      [](const std::vector<sent_packet_t> &sent) {
        return count_sent_records(sent, TYPE_SRV, WEB, true) > 0 &&
               count_sent_records(sent, TYPE_A, "myhost.local.", true) > 0;
      },
      2000ms));
  ASSERT_TRUE(wait_until([&] { return network->get_opens() == 2; }, 2000ms));

  // Same services, announced again
  ASSERT_TRUE(engine->get_local_host().state.wait_for_announced(2000ms));
  ASSERT_TRUE(info->state.wait_for_announced(2000ms));
  ASSERT_TRUE(engine->is_transport_open());
  auto services = engine->get_services();
  ASSERT_EQUAL(services.size(), 1);
  ASSERT_TRUE(services[0] == info);
  ASSERT_TRUE(engine->get_service("Web._HTTP._tcp.local.") == info);
  ASSERT_GT(count_sent_records(network->get_sent(), TYPE_SRV, WEB), 0);
  ASSERT_EQUAL(network->get_opens(), 2);

  engine->close();
  ASSERT_TRUE(engine->get_local_host().state.is_closed());
}

void test_recover_from_fatal_send_error() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto &host = engine->get_local_host();
  ASSERT_TRUE(host.state.wait_for_announced(2000ms));

  // Lost packets are just lost
  network->fail_sends(EAGAIN);
  outgoing_message_t query(dns_constants::FLAGS_QR_QUERY);
  query.add_question(question_t("myhost.local.", TYPE_A));
  network->inject(query, PEER);
  std::this_thread::sleep_for(100ms);
  ASSERT_EQUAL(network->get_opens(), 1);
  ASSERT_TRUE(host.state.is_announced());

  // But a broken socket is recovered
  network->fail_sends(EBADF);
  network->inject(query, PEER);
  ASSERT_TRUE(wait_until([&] { return network->get_opens() >= 2; }, 2000ms));
  network->fail_sends(0);

  ASSERT_TRUE(wait_until([&] { return host.state.is_announced(); }, 5000ms));
  engine->close();
}

void test_register_while_recovering() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto first = std::make_shared<service_info_t>("_http._tcp", "a", 8080);
  engine->register_service(first);
  ASSERT_TRUE(first->state.wait_for_announced(2000ms));

  network->fail(ENETDOWN);
  std::this_thread::sleep_for(20ms);
  // Host is still canceling, this is accepted
  auto second = std::make_shared<service_info_t>("_http._tcp", "b", 8081);
  engine->register_service(second);

  ASSERT_TRUE(wait_until([&] { return network->get_opens() == 2; }, 2000ms));
  ASSERT_TRUE(engine->get_local_host().state.wait_for_announced(3000ms));
  ASSERT_TRUE(first->state.wait_for_announced(3000ms));
  ASSERT_TRUE(second->state.wait_for_announced(3000ms));
  ASSERT_TRUE(engine->get_service("b._http._tcp.local.") == second);
  ASSERT_EQUAL(engine->get_services().size(), 2);

  engine->close();
}

void test_close_while_failing() {
  for (int round = 0; round < 20; round++) {
    auto network = std::make_shared<fake_network_t>();
    auto engine = make_engine(network, fast_config("myhost"));
    ASSERT_TRUE(engine->get_local_host().state.wait_for_announced(2000ms));

    std::thread failing([&network, round] {
      std::this_thread::sleep_for(std::chrono::microseconds(round * 100));
      network->fail(ENETDOWN);
    });
    engine->close();
    failing.join();

    // Once closed, nothing comes back to life
    auto opens = network->get_opens();
    std::this_thread::sleep_for(30ms);
    ASSERT_EQUAL(network->get_opens(), opens);
    ASSERT_FALSE(engine->is_transport_open());
    auto &host = engine->get_local_host().state;
    ASSERT_TRUE(host.is_closed() || host.is_canceled() || host.is_canceling());
  }
}

void test_recover_while_canceling_does_nothing() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto &host = engine->get_local_host().state;
  ASSERT_TRUE(host.wait_for_announced(2000ms));

  // Nobody drives it, so it stays canceling
  ASSERT_TRUE(host.cancel());
  engine->recover();
  std::this_thread::sleep_for(50ms);
  ASSERT_EQUAL(network->get_opens(), 1);
  ASSERT_TRUE(host.is_canceling());

  for (int i = 0; i < 3; i++) {
    ASSERT_TRUE(host.advance(nullptr));
  }
  ASSERT_TRUE(host.is_canceled());
  engine->recover();
  std::this_thread::sleep_for(50ms);
  ASSERT_EQUAL(network->get_opens(), 1);
  ASSERT_TRUE(host.is_canceled());

  // Down, close just releases
  engine->close();
  ASSERT_FALSE(engine->is_transport_open());
}

void test_recover_after_close_does_nothing() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto info = std::make_shared<service_info_t>("_http._tcp", "web", 8080);
  engine->register_service(info);
  ASSERT_TRUE(info->state.wait_for_announced(2000ms));
  network->clear_sent();

  engine->close();
  auto sent = network->get_sent();
  ASSERT_GT(count_sent_records(sent, TYPE_SRV, WEB, true), 0);
  ASSERT_GT(count_sent_records(sent, TYPE_A, "myhost.local.", true), 0);
  ASSERT_TRUE(engine->get_local_host().state.is_closed());
  ASSERT_TRUE(info->state.is_canceled());
  ASSERT_EQUAL(engine->get_services().size(), 0);
  ASSERT_FALSE(engine->is_transport_open());

  engine->recover();
  std::this_thread::sleep_for(50ms);
  ASSERT_EQUAL(network->get_opens(), 1);
  ASSERT_TRUE(engine->get_local_host().state.is_closed());

  try {
    engine->register_service(
        std::make_shared<service_info_t>("_http._tcp", "other", 8081));
    FAIL("Can not register on a closed engine");
  } catch (const illegal_state_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
  }
  // Twice is fine
  engine->close();
}

void test_registration_errors() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto other_network = std::make_shared<fake_network_t>();
  auto other_engine = make_engine(other_network, fast_config("otherhost"));
  ASSERT_NOT_EQUAL(engine->get_id(), other_engine->get_id());

  auto info = std::make_shared<service_info_t>("_http._tcp", "web", 8080);
  engine->register_service(info);
  ASSERT_EQUAL(info->get_engine(), engine->get_id());

  // Same name, other case
  try {
    engine->register_service(
        std::make_shared<service_info_t>("_http._tcp", "WEB", 8081));
    FAIL("Duplicated service name");
  } catch (const illegal_state_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
  }

  try {
    other_engine->register_service(info);
    FAIL("Registered at another engine");
  } catch (const illegal_state_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
  }

  try {
    service_info_t bad("_http._tcp", "my.web", 80);
    FAIL("Instance names can not have dots");
  } catch (const exception &e) {
    DEBUG("Got expected exception: {}", e.what());
  }
  try {
    service_info_t bad("http", "web", 80);
    FAIL("Types start with _");
  } catch (const exception &e) {
    DEBUG("Got expected exception: {}", e.what());
  }

  // Unregister cancels it, and then it can come back
  ASSERT_TRUE(info->state.wait_for_announced(2000ms));
  network->clear_sent();
  engine->unregister_service(info);
  ASSERT_TRUE(info->state.is_canceled());
  ASSERT_EQUAL(engine->get_services().size(), 0);
  ASSERT_GT(count_sent_records(network->get_sent(), TYPE_SRV, WEB, true), 0);
  // Unknown ones are ignored
  engine->unregister_service(info);

  engine->register_service(info);
  ASSERT_TRUE(info->state.wait_for_announced(2000ms));

  other_engine->close();
  engine->close();
}

class collect_listener_t : public answer_listener_t {
public:
  std::mutex mutex;
  std::vector<std::vector<record_t>> calls;

  void answers_received(const std::vector<record_t> &answers) override {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back(answers);
  }
  size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    return calls.size();
  }
};

void test_answer_listeners() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto first = std::make_shared<collect_listener_t>();
  auto second = std::make_shared<collect_listener_t>();
  auto unrelated = std::make_shared<collect_listener_t>();
  engine->add_answer_listener("_ipp._tcp.local", first);
  engine->add_answer_listener("_IPP._tcp.local.", first);
  // Short form is the same type
  engine->add_answer_listener("_ipp._tcp", second);
  engine->add_answer_listener("_http._tcp.local.", unrelated);

  outgoing_message_t response(dns_constants::FLAGS_QR_RESPONSE |
                              dns_constants::FLAGS_AA);
  response.add_answer(
      record_t::make_a("printer-host.local.", {192, 168, 1, 60}, 120));
  response.add_answer(record_t::make_ptr(
      "_ipp._tcp.local.", "printer._ipp._tcp.local.", 120));
  response.add_answer(record_t::make_srv("printer._ipp._tcp.local.", 0, 0, 631,
                                         "printer-host.local.", 120));
  network->inject(response, PEER);

  ASSERT_TRUE(wait_until(
      [&] { return first->count() == 1 && second->count() == 1; }, 2000ms));
  std::this_thread::sleep_for(50ms);
  // Once per listener, even if added twice
  ASSERT_EQUAL(first->count(), 1);
  ASSERT_EQUAL(second->count(), 1);
  ASSERT_EQUAL(unrelated->count(), 0);

  auto &answers = first->calls[0];
  ASSERT_EQUAL(answers.size(), 3);
  ASSERT_EQUAL(answers[0].type, TYPE_PTR);
  ASSERT_EQUAL(answers[1].type, TYPE_SRV);
  // Address records at the end
  ASSERT_EQUAL(answers[2].type, TYPE_A);

  // No PTR, nobody to tell
  outgoing_message_t address_only(dns_constants::FLAGS_QR_RESPONSE);
  address_only.add_answer(
      record_t::make_a("printer-host.local.", {192, 168, 1, 61}, 120));
  network->inject(address_only, PEER);
  std::this_thread::sleep_for(50ms);
  ASSERT_EQUAL(first->count(), 1);

  engine->close();
}

class throwing_listener_t : public answer_listener_t {
public:
  std::atomic<int> calls{0};
  bool std_exception;

  explicit throwing_listener_t(bool std_exception)
      : std_exception(std_exception) {}

  void answers_received(const std::vector<record_t> &answers) override {
    calls++;
    if (std_exception) {
      throw exception("Listener failed with {} answers", answers.size());
    }
    throw 42;
  }
};

void test_listener_failures_are_isolated() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  auto failing = std::make_shared<throwing_listener_t>(true);
  auto failing_badly = std::make_shared<throwing_listener_t>(false);
  auto healthy = std::make_shared<collect_listener_t>();
  engine->add_answer_listener("_ipp._tcp", failing);
  engine->add_answer_listener("_ipp._tcp", failing_badly);
  engine->add_answer_listener("_ipp._tcp", healthy);

  outgoing_message_t response(dns_constants::FLAGS_QR_RESPONSE |
                              dns_constants::FLAGS_AA);
  response.add_answer(record_t::make_ptr(
      "_ipp._tcp.local.", "printer._ipp._tcp.local.", 120));
  network->inject(response, PEER);
  network->inject(response, PEER);

  ASSERT_TRUE(wait_until([&] { return healthy->count() == 2; }, 2000ms));
  ASSERT_EQUAL(failing->calls.load(), 2);
  ASSERT_EQUAL(failing_badly->calls.load(), 2);

  engine->close();
}

void test_conflict_probes_again() {
  auto network = std::make_shared<fake_network_t>();
  auto config = fast_config("myhost");
  config.probe_wait = 200ms;
  auto engine = make_engine(network, config);
  auto info = std::make_shared<service_info_t>("_http._tcp", "web", 8080);
  engine->register_service(info);

  ASSERT_TRUE(network->wait_for(
      [](const std::vector<sent_packet_t> &sent) {
        return count_probes(sent, WEB) > 0;
      },
      2000ms));
  ASSERT_TRUE(info->state.is_probing());

  // Our own data is no conflict
  outgoing_message_t same(dns_constants::FLAGS_QR_RESPONSE);
  same.add_answer(
      record_t::make_srv(WEB, 0, 0, 8080, "myhost.local.", 120));
  network->inject(same, PEER);
  ASSERT_TRUE(info->state.is_probing());

  outgoing_message_t conflict(dns_constants::FLAGS_QR_RESPONSE |
                              dns_constants::FLAGS_AA);
  conflict.add_answer(
      record_t::make_srv(WEB, 0, 0, 9999, "otherhost.local.", 120));
  network->inject(conflict, PEER);
  ASSERT_TRUE(info->state.is_probing());

  ASSERT_TRUE(info->state.wait_for_announced(5000ms));
  // The first probe, and three more after the conflict
  ASSERT_GTE(count_probes(network->get_sent(), WEB), 4);

  engine->close();
}

void test_service_resolver() {
  auto network = std::make_shared<fake_network_t>();
  auto engine = make_engine(network, fast_config("myhost"));
  ASSERT_TRUE(engine->get_local_host().state.wait_for_announced(2000ms));

  engine->start_service_resolver("_ipp._tcp");
  ASSERT_TRUE(network->wait_for(
      [](const std::vector<sent_packet_t> &sent) {
        return count_probes(sent, "_ipp._tcp.local.") == 3;
      },
      2000ms));
  std::this_thread::sleep_for(100ms);
  ASSERT_EQUAL(count_probes(network->get_sent(), "_ipp._tcp.local."), 3);

  engine->close();
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_register_announce_and_answer),
      TEST(test_recover_from_receive_error),
      TEST(test_recover_from_fatal_send_error),
      TEST(test_register_while_recovering),
      TEST(test_close_while_failing),
      TEST(test_recover_while_canceling_does_nothing),
      TEST(test_recover_after_close_does_nothing),
      TEST(test_registration_errors),
      TEST(test_answer_listeners),
      TEST(test_listener_failures_are_isolated),
      TEST(test_conflict_probes_again),
      TEST(test_service_resolver),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
