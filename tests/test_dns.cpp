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
#include <lanmdns/dns.hpp>
#include <lanmdns/exceptions.hpp>
#include <unordered_set>

using namespace lanmdns;

void test_read_compressed_names() {
  auto data = hex_to_bin(
      "00 00 84 00 00 00 00 02 00 00 00 00" // response, 2 answers
      "06 'myhost' 05 'local' 00"           // at offset 12
      "00 01 80 01 00 00 00 78 00 04"       // A, unique, ttl 120
      "C0 A8 01 02"                         // 192.168.1.2
      "05 '_http' 04 '_tcp' C0 13"          // _http._tcp + local.
      "00 0C 00 01 00 00 0E 10 00 02"       // PTR, ttl 3600
      "C0 0C"                               // myhost.local.
  );
  io_bytes_reader reader(data);
  auto msg = incoming_message_t::parse(reader);

  ASSERT_TRUE(msg.is_response());
  ASSERT_EQUAL(msg.questions.size(), 0);
  ASSERT_EQUAL(msg.answers.size(), 2);

  auto &a = msg.answers[0];
  ASSERT_EQUAL(a.name, "myhost.local.");
  ASSERT_EQUAL(a.type, TYPE_A);
  ASSERT_TRUE(a.unique);
  ASSERT_EQUAL(a.ttl, 120);
  std::array<uint8_t, 4> expected{192, 168, 1, 2};
  ASSERT_TRUE(std::get<record_a_t>(a.data).address == expected);

  auto &ptr = msg.answers[1];
  ASSERT_EQUAL(ptr.name, "_http._tcp.local.");
  ASSERT_EQUAL(ptr.type, TYPE_PTR);
  ASSERT_FALSE(ptr.unique);
  ASSERT_EQUAL(std::get<record_ptr_t>(ptr.data).alias, "myhost.local.");
}

void test_compression_loop_is_an_error() {
  auto data = hex_to_bin("00 00 00 00 00 01 00 00 00 00 00 00"
                         "C0 0C 00 01 00 01");
  io_bytes_reader reader(data);
  try {
    incoming_message_t::parse(reader);
  } catch (const protocol_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
    return;
  }
  FAIL("Should have thrown a protocol_exception");
}

void test_truncated_message_is_an_error() {
  auto data = hex_to_bin("00 00 00 00 00 01 00 00 00 00 00 00"
                         "05 'lo'");
  io_bytes_reader reader(data);
  try {
    incoming_message_t::parse(reader);
  } catch (const protocol_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
    return;
  }
  FAIL("Should have thrown a protocol_exception");
}

void test_edns_payload_size() {
  auto data = hex_to_bin(
      "12 34 00 00 00 01 00 00 00 00 00 01" // query, 1 question, 1 additional
      "05 '_http' 04 '_tcp' 05 'local' 00"
      "00 0C 00 01"
      "00 00 29 05 A0 00 00 00 00 00 00" // OPT, payload 1440
  );
  io_bytes_reader reader(data);
  auto msg = incoming_message_t::parse(reader);

  ASSERT_TRUE(msg.is_query());
  ASSERT_EQUAL(msg.id, 0x1234);
  ASSERT_EQUAL(msg.questions.size(), 1);
  ASSERT_EQUAL(msg.questions[0].name, "_http._tcp.local.");
  ASSERT_EQUAL(msg.questions[0].type, TYPE_PTR);
  ASSERT_FALSE(msg.questions[0].unicast);
  // The OPT record is not an answer
  ASSERT_EQUAL(msg.answers.size(), 0);
  ASSERT_EQUAL(msg.sender_udp_payload, 1440);
}

void test_unicast_question_bit() {
  outgoing_message_t out(dns_constants::FLAGS_QR_QUERY);
  ASSERT_TRUE(out.add_question(question_t("myhost.local.", TYPE_ANY, true)));
  auto data = out.serialize();
  ASSERT_EQUAL(data.size(), out.size());

  io_bytes_reader reader(data);
  auto msg = incoming_message_t::parse(reader);
  ASSERT_EQUAL(msg.questions.size(), 1);
  ASSERT_TRUE(msg.questions[0].unicast);
  ASSERT_EQUAL(msg.questions[0].dns_class, dns_constants::CLASS_IN);
}

void test_srv_and_txt_records() {
  outgoing_message_t out(dns_constants::FLAGS_QR_RESPONSE |
                         dns_constants::FLAGS_AA);
  auto srv = record_t::make_srv("web._http._tcp.local.", 1, 2, 8080,
                                "myhost.local.", 120);
  auto txt = record_t::make_txt("web._http._tcp.local.",
                                {"path=/", "version=2"}, 120);
  ASSERT_TRUE(out.add_answer(srv));
  ASSERT_TRUE(out.add_answer(txt));

  auto data = out.serialize();
  io_bytes_reader reader(data);
  auto msg = incoming_message_t::parse(reader);
  ASSERT_EQUAL(msg.flags, dns_constants::FLAGS_QR_RESPONSE |
                              dns_constants::FLAGS_AA);
  ASSERT_EQUAL(msg.answers.size(), 2);

  auto &srv_data = std::get<record_srv_t>(msg.answers[0].data);
  ASSERT_EQUAL(srv_data.priority, 1);
  ASSERT_EQUAL(srv_data.weight, 2);
  ASSERT_EQUAL(srv_data.port, 8080);
  ASSERT_EQUAL(srv_data.target, "myhost.local.");
  ASSERT_TRUE(msg.answers[0].unique);

  auto &txt_data = std::get<record_txt_t>(msg.answers[1].data);
  ASSERT_EQUAL(txt_data.strings.size(), 2);
  ASSERT_EQUAL(txt_data.strings[1], "version=2");
}

void test_unknown_records_are_kept() {
  auto data = hex_to_bin("00 00 84 00 00 00 00 01 00 00 00 00"
                         "04 'host' 05 'local' 00"
                         "00 2F 80 01 00 00 00 78 00 03" // NSEC
                         "AA BB CC");
  io_bytes_reader reader(data);
  auto msg = incoming_message_t::parse(reader);
  ASSERT_EQUAL(msg.answers.size(), 1);
  ASSERT_EQUAL(msg.answers[0].type, TYPE_NSEC);
  auto &raw = std::get<record_raw_t>(msg.answers[0].data);
  ASSERT_EQUAL(raw.data.size(), 3);
  ASSERT_EQUAL(raw.data[2], 0xCC);
}

void test_record_identity() {
  auto a = record_t::make_a("MyHost.local.", {10, 0, 0, 1}, 120);
  auto b = record_t::make_a("myhost.local.", {10, 0, 0, 1}, 0);
  auto c = record_t::make_a("myhost.local.", {10, 0, 0, 2}, 120);

  // Names ignore case and TTL does not count
  ASSERT_TRUE(a == b);
  ASSERT_TRUE(a.hash() == b.hash());
  ASSERT_TRUE(a != c);
  ASSERT_TRUE(a.same_data(b));
  ASSERT_FALSE(a.same_data(c));

  std::unordered_set<record_t> answers;
  answers.insert(a);
  answers.insert(b);
  answers.insert(c);
  ASSERT_EQUAL(answers.size(), 2);
}

void test_question_answered_by() {
  auto a = record_t::make_a("myhost.local.", {10, 0, 0, 1}, 120);
  ASSERT_TRUE(question_t("MYHOST.local.", TYPE_A).is_answered_by(a));
  ASSERT_TRUE(question_t("myhost.local.", TYPE_ANY).is_answered_by(a));
  ASSERT_FALSE(question_t("myhost.local.", TYPE_AAAA).is_answered_by(a));
  ASSERT_FALSE(question_t("other.local.", TYPE_A).is_answered_by(a));
}

void test_address_records_last() {
  std::vector<record_t> records{
      record_t::make_a("host.local.", {10, 0, 0, 1}, 120),
      record_t::make_ptr("_http._tcp.local.", "web._http._tcp.local.", 120),
      record_t::make_aaaa("host.local.", {0xfe, 0x80}, 120),
      record_t::make_srv("web._http._tcp.local.", 0, 0, 80, "host.local.",
                         120),
  };
  auto sorted = address_records_last(records);
  ASSERT_EQUAL(sorted.size(), 4);
  ASSERT_EQUAL(sorted[0].type, TYPE_PTR);
  ASSERT_EQUAL(sorted[1].type, TYPE_SRV);
  ASSERT_EQUAL(sorted[2].type, TYPE_A);
  ASSERT_EQUAL(sorted[3].type, TYPE_AAAA);
}

void test_build_messages_splits() {
  outgoing_message_t header(dns_constants::FLAGS_QR_RESPONSE |
                                dns_constants::FLAGS_AA,
                            true, 512);
  std::vector<record_t> answers;
  for (int i = 0; i < 40; i++) {
    answers.push_back(record_t::make_txt(
        FMT::format("svc{}._http._tcp.local.", i),
        {std::string(60, 'x')}, 120));
  }

  auto messages = build_messages(header, {}, answers);
  ASSERT_GT(messages.size(), 1);

  std::vector<std::string> names;
  for (auto &msg : messages) {
    ASSERT_LTE(msg.size(), 512);
    ASSERT_FALSE(msg.is_empty());
    ASSERT_EQUAL(msg.serialize().size(), msg.size());
    ASSERT_EQUAL(msg.flags, header.flags);
    for (auto &record : msg.answers) {
      names.push_back(record.name);
    }
  }
  // Nothing lost, same order
  ASSERT_EQUAL(names.size(), answers.size());
  for (size_t i = 0; i < names.size(); i++) {
    ASSERT_EQUAL(names[i], answers[i].name);
  }
}

void test_build_messages_drops_what_never_fits() {
  outgoing_message_t header(dns_constants::FLAGS_QR_RESPONSE, true, 100);
  std::vector<record_t> answers{
      record_t::make_txt("big.local.", {std::string(200, 'x')}, 120),
      record_t::make_a("host.local.", {10, 0, 0, 1}, 120),
  };
  auto messages = build_messages(header, {}, answers);
  ASSERT_EQUAL(messages.size(), 1);
  ASSERT_EQUAL(messages[0].answers.size(), 1);
  ASSERT_EQUAL(messages[0].answers[0].type, TYPE_A);
}

void test_invalid_names() {
  outgoing_message_t out(dns_constants::FLAGS_QR_QUERY);
  try {
    out.add_question(question_t(std::string(64, 'a') + ".local.", TYPE_A));
  } catch (const protocol_exception &e) {
    DEBUG("Got expected exception: {}", e.what());
    return;
  }
  FAIL("Labels longer than 63 chars are invalid");
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_read_compressed_names),
      TEST(test_compression_loop_is_an_error),
      TEST(test_truncated_message_is_an_error),
      TEST(test_edns_payload_size),
      TEST(test_unicast_question_bit),
      TEST(test_srv_and_txt_records),
      TEST(test_unknown_records_are_kept),
      TEST(test_record_identity),
      TEST(test_question_answered_by),
      TEST(test_address_records_last),
      TEST(test_build_messages_splits),
      TEST(test_build_messages_drops_what_never_fits),
      TEST(test_invalid_names),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}
