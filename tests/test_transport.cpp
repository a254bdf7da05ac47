#include "test_framework.hpp"
#include "tests/helpers/ws_test_server.hpp"

#include "llmws/common/json_util.hpp"
#include "llmws/transport/message_queue.hpp"
#include "llmws/transport/session.hpp"
#include "llmws/transport/websocket.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

namespace {

using namespace std::chrono_literals;

std::string type_of(const llmws::transport::ParsedMessage &message) {
  return llmws::common::json_string_field(message, "type").value_or("");
}

} // namespace

void register_transport_tests(std::vector<llmws::tests::TestCase> &tests) {
  using llmws::tests::require;
  namespace transport = llmws::transport;
  namespace testing = llmws::testing;

  tests.push_back({"message_queue_splits_lines_and_drops_garbage", [] {
                     transport::MessageQueue queue;
                     queue.push_raw("{\"type\":\"a\"}\r\n\nnot json\n[1,2]\n  {\"type\":\"b\"}  ");
                     require(queue.size() == 2, "two objects queued");
                     auto first = queue.next(10ms);
                     require(first.ok() && type_of(first.value()) == "a", "first in order");
                     auto second = queue.next(10ms);
                     require(second.ok() && type_of(second.value()) == "b", "second in order");
                   }});

  tests.push_back({"message_queue_delivers_buffer_before_sticky_error", [] {
                     transport::MessageQueue queue;
                     queue.push_raw("{\"type\":\"token\",\"text\":\"x\"}");
                     queue.fail("LLMWS socket closed (1011): boom");
                     queue.fail("second failure");
                     auto buffered = queue.next(10ms);
                     require(buffered.ok() && type_of(buffered.value()) == "token",
                             "buffered message first");
                     for (int i = 0; i < 2; ++i) {
                       auto failed = queue.next(10ms);
                       require(!failed.ok(), "error after drain");
                       require(failed.error() == "LLMWS socket closed (1011): boom",
                               "first error sticks");
                     }
                   }});

  tests.push_back({"message_queue_times_out", [] {
                     transport::MessageQueue queue;
                     auto result = queue.next(20ms);
                     require(!result.ok(), "empty queue times out");
                     require(result.error() == "LLMWS read timeout (20ms)", result.error());
                     require(!queue.terminal_error().has_value(), "timeout is not terminal");
                   }});

  tests.push_back({"message_queue_wakes_waiting_reader", [] {
                     transport::MessageQueue queue;
                     std::thread producer([&queue]() {
                       std::this_thread::sleep_for(20ms);
                       queue.push_raw("{\"type\":\"welcome\"}\n");
                     });
                     auto result = queue.next(2000ms);
                     producer.join();
                     require(result.ok() && type_of(result.value()) == "welcome",
                             "message handed across threads");
                   }});

  tests.push_back({"parse_ws_url_accepts_valid_forms", [] {
                     auto plain = transport::parse_ws_url("ws://localhost:8765");
                     require(plain.ok(), "plain url");
                     require(!plain.value().secure && plain.value().host == "localhost" &&
                                 plain.value().port == 8765 && plain.value().path == "/",
                             "plain url fields");

                     auto secure = transport::parse_ws_url("WSS://example.com/ws?x=1#frag");
                     require(secure.ok() && secure.value().secure, "wss scheme");
                     require(secure.value().port == 443, "default tls port");
                     require(secure.value().path == "/ws?x=1", "fragment removed");

                     auto query_only = transport::parse_ws_url("ws://h?token=a");
                     require(query_only.ok() && query_only.value().path == "/?token=a",
                             "query gets a leading slash");

                     auto v6 = transport::parse_ws_url("ws://[::1]:9000/");
                     require(v6.ok() && v6.value().host == "::1" && v6.value().port == 9000,
                             "bracketed ipv6 host");

                     auto userinfo = transport::parse_ws_url("ws://user:pw@host:81");
                     require(userinfo.ok() && userinfo.value().host == "host" &&
                                 userinfo.value().port == 81,
                             "userinfo dropped");
                   }});

  tests.push_back({"parse_ws_url_rejects_invalid_forms", [] {
                     auto no_scheme = transport::parse_ws_url("localhost:8765");
                     require(!no_scheme.ok() &&
                                 no_scheme.error().rfind("invalid websocket url:", 0) == 0,
                             "missing scheme");
                     auto http = transport::parse_ws_url("http://host");
                     require(!http.ok() && http.error() == "unsupported websocket scheme: http",
                             "http rejected");
                     auto no_host = transport::parse_ws_url("ws://:80/");
                     require(!no_host.ok() &&
                                 no_host.error().rfind("missing websocket host:", 0) == 0,
                             "missing host");
                     auto bad_port = transport::parse_ws_url("ws://host:99999");
                     require(!bad_port.ok() && bad_port.error() == "invalid websocket port: 99999",
                             "port out of range");
                     auto bracket = transport::parse_ws_url("ws://[::1");
                     require(!bracket.ok() &&
                                 bracket.error().rfind("invalid websocket host:", 0) == 0,
                             "unterminated bracket");
                   }});

  tests.push_back({"websocket_accept_key_matches_rfc_sample", [] {
                     require(transport::websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==") ==
                                 "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",
                             "RFC 6455 sample");
                   }});

  tests.push_back({"errno_name_is_symbolic", [] {
                     require(transport::errno_name(ECONNREFUSED) == "ECONNREFUSED", "refused");
                     require(transport::errno_name(ETIMEDOUT) == "ETIMEDOUT", "timed out");
                   }});

  tests.push_back({"websocket_session_exchanges_json_lines", [] {
                     std::string received;
                     testing::LoopbackWsServer server([&received](testing::ServerPeer &peer) {
                       received = peer.read_text().value_or("");
                       (void)peer.send_text("{\"type\":\"welcome\",\"session_id\":\"s-9\"}\n"
                                            "{\"type\":\"start\"}\n");
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), opened.ok() ? "" : opened.error());
                     auto &connection = *opened.value();
                     require(connection.send("{}\n").ok(), "hello sent");

                     auto welcome = connection.next(2000ms);
                     require(welcome.ok() && type_of(welcome.value()) == "welcome",
                             "welcome line");
                     require(llmws::common::json_string_field(welcome.value(), "session_id")
                                     .value_or("") == "s-9",
                             "session id carried");
                     auto start = connection.next(2000ms);
                     require(start.ok() && type_of(start.value()) == "start",
                             "second line of the same frame");
                     connection.close();
                     server.stop();

                     require(received == "{}\n", "server saw the hello verbatim");
                     require(server.last_request().find("Sec-WebSocket-Version: 13") !=
                                 std::string::npos,
                             "upgrade request headers");
                   }});

  tests.push_back({"websocket_session_reassembles_fragments_and_answers_ping", [] {
                     std::string pong;
                     testing::LoopbackWsServer server([&pong](testing::ServerPeer &peer) {
                       (void)peer.send_frame(0x9, "hb");
                       auto frame = peer.read_frame();
                       if (frame.has_value() && frame->opcode == 0xA) {
                         pong = frame->payload;
                       }
                       (void)peer.send_frame(0x1, "{\"type\":\"tok", false);
                       (void)peer.send_frame(0x0, "en\",\"text\":\"hi\"}");
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     auto message = opened.value()->next(2000ms);
                     require(message.ok() && type_of(message.value()) == "token",
                             "fragmented message reassembled");
                     opened.value()->close();
                     server.stop();
                     require(pong == "hb", "ping answered with the same payload");
                   }});

  tests.push_back({"websocket_session_reports_server_close", [] {
                     testing::LoopbackWsServer server([](testing::ServerPeer &peer) {
                       (void)peer.send_text("{\"type\":\"start\"}");
                       (void)peer.send_close(1011, "boom");
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     auto &connection = *opened.value();
                     auto start = connection.next(2000ms);
                     require(start.ok() && type_of(start.value()) == "start",
                             "message before close delivered");
                     auto closed = connection.next(2000ms);
                     require(!closed.ok(), "close surfaces as error");
                     require(closed.error() == "LLMWS socket closed (1011): boom", closed.error());
                     auto send = connection.send("{}\n");
                     require(!send.ok() && send.error() == closed.error(),
                             "send after close reports the terminal error");
                     connection.close();
                     auto again = connection.next(10ms);
                     require(!again.ok() && again.error() == closed.error(),
                             "local close keeps the first error");
                     server.stop();
                   }});

  tests.push_back({"websocket_session_reports_hang_up", [] {
                     testing::LoopbackWsServer server(
                         [](testing::ServerPeer &peer) { peer.hang_up(); });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     auto result = opened.value()->next(2000ms);
                     require(!result.ok(), "hang up surfaces as error");
                     require(result.error().rfind("LLMWS socket closed (1006)", 0) == 0 ||
                                 result.error().find("ECONNRESET") != std::string::npos,
                             result.error());
                     opened.value()->close();
                     server.stop();
                   }});

  tests.push_back({"websocket_rejects_oversized_control_frame", [] {
                     testing::LoopbackWsServer server([](testing::ServerPeer &peer) {
                       (void)peer.send_frame(0x9, std::string(126, 'p'));
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     auto result = opened.value()->next(2000ms);
                     require(!result.ok() &&
                                 result.error() == "Invalid WebSocket frame: invalid control frame",
                             result.ok() ? "unexpected message" : result.error());
                     opened.value()->close();
                     server.stop();
                   }});

  tests.push_back({"websocket_closes_with_1009_on_oversized_message", [] {
                     std::optional<int> close_code;
                     testing::LoopbackWsServer server([&close_code](testing::ServerPeer &peer) {
                       // Header only: a 26 MiB text frame the client must refuse to read.
                       const std::uint64_t length = transport::kMaxPayloadBytes + 1024 * 1024;
                       std::string header = "\x81\x7F";
                       for (int shift = 56; shift >= 0; shift -= 8) {
                         header.push_back(static_cast<char>((length >> shift) & 0xFFu));
                       }
                       (void)peer.send_raw(header);
                       auto frame = peer.read_frame();
                       if (frame.has_value() && frame->opcode == 0x8 && frame->payload.size() >= 2) {
                         close_code = (static_cast<unsigned char>(frame->payload[0]) << 8) |
                                      static_cast<unsigned char>(frame->payload[1]);
                       }
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     auto result = opened.value()->next(2000ms);
                     require(!result.ok() && result.error() == "Max payload size exceeded",
                             result.ok() ? "unexpected message" : result.error());
                     opened.value()->close();
                     server.stop();
                     require(close_code == std::optional<int>(transport::kCloseMessageTooBig),
                             "server received close 1009");
                   }});

  tests.push_back({"websocket_close_gives_up_on_silent_peer", [] {
                     bool close_seen = false;
                     testing::LoopbackWsServer server([&close_seen](testing::ServerPeer &peer) {
                       auto frame = peer.read_frame();
                       close_seen = frame.has_value() && frame->opcode == 0x8;
                       // Never answer; the client has to tear down on its own.
                       std::this_thread::sleep_for(1500ms);
                     });
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(opened.ok(), "connected");
                     const auto started = std::chrono::steady_clock::now();
                     opened.value()->close();
                     const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started);
                     require(took >= transport::kCloseGrace - 50ms,
                             "waited for the close grace (" + std::to_string(took.count()) + "ms)");
                     require(took < transport::kCloseGrace + 700ms,
                             "close did not hang (" + std::to_string(took.count()) + "ms)");
                     auto after = opened.value()->next(10ms);
                     require(!after.ok(), "closed connection yields errors");
                     server.stop();
                     require(close_seen, "close frame sent to the peer");
                   }});

  tests.push_back({"websocket_connect_reports_rejected_upgrade", [] {
                     testing::LoopbackWsServer server([](testing::ServerPeer &) {});
                     server.reject_upgrade_with(503);
                     require(server.start().ok(), "server started");

                     transport::WebSocketConnector connector;
                     auto opened = connector.open(server.url(), 2000ms);
                     require(!opened.ok(), "upgrade refused");
                     require(opened.error() == "Unexpected server response: 503", opened.error());
                     server.stop();
                   }});

  tests.push_back({"websocket_connect_reports_refused_port", [] {
                     std::uint16_t port = 0;
                     {
                       testing::LoopbackWsServer server([](testing::ServerPeer &) {});
                       require(server.start().ok(), "server started");
                       port = server.port();
                       server.stop();
                     }
                     transport::WebSocketConnector connector;
                     const std::string url = "ws://127.0.0.1:" + std::to_string(port) + "/";
                     auto opened = connector.open(url, 1000ms);
                     require(!opened.ok(), "nothing listening");
                     require(opened.error() ==
                                 "connect ECONNREFUSED 127.0.0.1:" + std::to_string(port),
                             opened.error());
                   }});
}
