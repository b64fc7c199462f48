#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/protocol.hpp"
#include "gitwire/transport.hpp"

#include "test_util.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;
using gitwire::BufferConnection;
using gitwire::Protocol;

int main() {
  try {
    // Encoding
    check(gitwire::pkt_line("hello"s) == "0009hello", "pkt_line hello");
    check(gitwire::pkt_line(std::nullopt) == "0000", "flush");
    check(gitwire::pkt_line(""s) == "0004", "empty payload");
    const std::string biggest(gitwire::consts::kMaxPktPayload, 'x');
    check(gitwire::pkt_line(biggest).substr(0, 4) == "fff0", "max payload prefix");
    check_throws<std::length_error>([&] { (void)gitwire::pkt_line(biggest + "x"); },
                                    "oversized payload");

    // Decoding, including a zero-length payload
    {
      BufferConnection conn("0009hello" + kFlushPkt + "0004" + "000aworld\n");
      Protocol proto(conn);
      check(proto.read_pkt_line() == "hello"s, "read hello");
      check(!proto.read_pkt_line().has_value(), "read flush");
      check(proto.read_pkt_line() == ""s, "read empty");
      check(proto.read_pkt_line() == "world\n"s, "read world");
      check(!proto.can_read(), "stream consumed");
    }

    // Malformed framing
    for (const std::string bad : {"zzzz"s, "0003"s, "0001"s, "0009hel"s, "00"s}) {
      BufferConnection conn(bad);
      Protocol proto(conn);
      check_throws<gitwire::ProtocolError>([&] { (void)proto.read_pkt_line(); }, "bad: " + bad);
    }

    // write_pkt_seq then read_pkt_seq reproduces the payloads
    {
      const std::vector<std::string> payloads{"a\n", "", "\0binary\xff"s, std::string(1000, 'q')};
      BufferConnection out;
      Protocol writer(out);
      writer.write_pkt_seq(payloads);

      BufferConnection in(out.written() + pkt("after"));
      Protocol reader(in);
      std::vector<std::string> got;
      for (const auto &p : reader.read_pkt_seq()) {
        got.push_back(p);
      }
      check(got == payloads, "seq round trip");
      check(reader.read_pkt_line() == "after"s, "seq stops at flush");
    }

    // Daemon request line
    {
      BufferConnection out;
      Protocol proto(out);
      proto.send_cmd("git-upload-pack", {"/foo.git", "host=example.com"});
      check(out.written() == pkt("git-upload-pack /foo.git\0host=example.com\0"s), "send_cmd");
    }

    // Incremental parser across chunk boundaries
    {
      std::vector<std::string> got;
      gitwire::PktLineParser parser([&got](const gitwire::Packet &p) {
        got.push_back(p ? *p : "<flush>");
      });
      parser.parse("00");
      check(got.empty() && parser.pending() == "00", "partial prefix pending");
      parser.parse("06ab00");
      parser.parse("000005x");
      check((got == std::vector<std::string>{"ab", "<flush>", "x"}), "parser packets");
      check(parser.pending().empty(), "parser drained");
    }

    // Sideband demultiplexing
    {
      BufferConnection conn(pkt("\x01PACKDATA") + pkt("\x02" "counting\n") + pkt("\x01MORE") +
                            kFlushPkt);
      Protocol proto(conn);
      std::string data;
      std::string progress;
      gitwire::read_sideband(proto, {.data = [&](std::string_view d) { data.append(d); },
                                     .progress = [&](std::string_view d) { progress.append(d); }});
      check(data == "PACKDATAMORE", "sideband data");
      check(progress == "counting\n", "sideband progress");
    }
    {
      // empty handlers discard
      BufferConnection conn(pkt("\x02noise") + kFlushPkt);
      Protocol proto(conn);
      gitwire::read_sideband(proto, {});
    }
    {
      BufferConnection conn(pkt("\x03" "access denied") + kFlushPkt);
      Protocol proto(conn);
      try {
        gitwire::read_sideband(proto, {});
        check(false, "fatal channel must throw");
      } catch (const gitwire::ProtocolError &e) {
        check(std::string(e.what()).find("access denied") != std::string::npos,
              "fatal message carried");
      }
    }
    for (const std::string bad : {pkt("\x04oops"), pkt("")}) {
      BufferConnection conn(bad + kFlushPkt);
      Protocol proto(conn);
      check_throws<gitwire::ProtocolError>([&] { gitwire::read_sideband(proto, {}); },
                                           "bad sideband packet");
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
