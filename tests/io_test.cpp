// cuebridge-Prod headers
#include "core/CommandClassifier.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/ExecutionSerializer.hpp"
#include "io/StreamSocket.hpp"
#include "io/TcpConnection.hpp"

// cuebridge-Fake headers
#include "FakeHost.hpp"
#include "FakeStreamSocket.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <cstring>
#include <thread>

// Linux headers
#include <sys/socket.h>
#include <unistd.h>

namespace cuebridge::test {

  using core::CommandKind;
  using io::StreamSocket;
  using io::TcpConnection;
  using nlohmann::json;
  using namespace std::chrono_literals;

  //---StreamSocket--------------------------------------------------------

  TEST(stream_socket, reads_writes_and_sees_peer_close) {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));

    StreamSocket sock(fds[0]);
    EXPECT_EQ(sock.read(10ms).status, StreamSocket::ReadStatus::Timeout);

    const char* msg = "{\"type\":\"undo\"}";
    ASSERT_EQ(::write(fds[1], msg, std::strlen(msg)), static_cast<ssize_t>(std::strlen(msg)));
    auto chunk = sock.read(100ms);
    ASSERT_EQ(chunk.status, StreamSocket::ReadStatus::Data);
    EXPECT_EQ(chunk.bytes, msg);

    ASSERT_TRUE(sock.writeAll("{\"status\":\"success\",\"result\":{}}\n"));
    char buf[64] = { 0 };
    ASSERT_GT(::read(fds[1], buf, sizeof(buf) - 1), 0);
    EXPECT_STREQ(buf, "{\"status\":\"success\",\"result\":{}}\n");

    ::close(fds[1]);
    EXPECT_EQ(sock.read(100ms).status, StreamSocket::ReadStatus::Closed);
    EXPECT_FALSE(sock.writeAll("late")); // EPIPE, but no SIGPIPE
  }

  TEST(stream_socket, move_transfers_ownership) {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    StreamSocket a(fds[0]);
    StreamSocket b(std::move(a));
    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    b.close();
    EXPECT_FALSE(b.isOpen());
    ::close(fds[1]);
  }

  TEST(stream_socket, shutdown_from_another_thread_races_close_safely) {
    for (int round = 0; round < 50; ++round) {
      int fds[2];
      ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
      StreamSocket sock(fds[0]);

      std::thread closer([&sock] {
        (void)sock.read(1ms);
        sock.close();
      });
      sock.shutdown();
      closer.join();

      EXPECT_FALSE(sock.isOpen());
      sock.shutdown(); // released descriptor: no-op
      ::close(fds[1]);
    }
  }

  TEST(stream_socket, shutdown_wakes_the_reader_with_closed) {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    StreamSocket sock(fds[0]);

    std::thread waker([&sock] {
      std::this_thread::sleep_for(20ms);
      sock.shutdown();
    });
    EXPECT_EQ(sock.read(2000ms).status, StreamSocket::ReadStatus::Closed);
    waker.join();
    sock.close();
    ::close(fds[1]);
  }

  //---TcpConnection-------------------------------------------------------

  class TcpConnectionTest : public ::testing::Test {
  protected:
    void SetUp() override {
      auto fake = std::make_unique<FakeHost>();
      host = fake.get();
      logger = std::make_shared<core::Logger>();
      serializer = std::make_unique<core::ExecutionSerializer>(std::move(fake), logger);
      dispatcher = std::make_unique<core::CommandDispatcher>(classifier, *serializer, logger, 2s);
      serializer->start();

      auto sock = std::make_unique<FakeStreamSocket>();
      socket = sock.get(); // raw ptr for assertions
      connection = std::make_unique<TcpConnection>(std::move(sock), *dispatcher, logger,
                                                   "test-peer", 1024, 10ms);
    }

    std::vector<json> replies() const {
      std::vector<json> out;
      for (const auto& w : socket->written)
        out.push_back(json::parse(w));
      return out;
    }

    FakeHost* host = nullptr;
    FakeStreamSocket* socket = nullptr;
    std::shared_ptr<core::Logger> logger;
    core::CommandClassifier classifier;
    std::unique_ptr<core::ExecutionSerializer> serializer;
    std::unique_ptr<core::CommandDispatcher> dispatcher;
    std::unique_ptr<TcpConnection> connection;
    std::atomic<bool> keepRunning{ true };
  };

  TEST_F(TcpConnectionTest, one_response_per_request_in_order) {
    socket->pushData("{\"type\":\"create_midi_track\"}{\"type\":\"set_track_name\",");
    socket->pushData("\"params\":{\"name\":\"Lead\"}}\n{\"type\":\"get_session_info\"}\n");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0]["result"]["command"], "create_midi_track");
    EXPECT_EQ(out[1]["result"]["params"]["name"], "Lead");
    EXPECT_EQ(out[2]["result"]["command"], "get_session_info");
    for (const auto& w : socket->written)
      EXPECT_EQ(w.back(), '\n');
    EXPECT_TRUE(connection->finished());
    EXPECT_EQ(connection->requestsHandled(), 3u);
  }

  TEST_F(TcpConnectionTest, malformed_input_gets_parse_error_and_connection_continues) {
    socket->pushData("this is not json\n");
    socket->pushData("{\"type\": oops}");
    socket->pushData("{\"params\":{}}");
    socket->pushData("{\"type\":\"undo\"}");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 4u);
    for (std::size_t i = 0; i < 3; ++i) {
      EXPECT_EQ(out[i]["status"], "error") << i;
      EXPECT_EQ(out[i]["error_kind"], "parse_error") << i;
    }
    EXPECT_EQ(out[3]["status"], "success");
    EXPECT_EQ(host->calls().size(), 1u);
  }

  TEST_F(TcpConnectionTest, unknown_and_host_errors_are_answered) {
    host->failWith.insert(CommandKind::DeleteTrack);
    socket->pushData("{\"type\":\"warp_time\"}{\"type\":\"delete_track\",\"params\":{\"track_index\":7}}");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0]["error_kind"], "unknown_command");
    EXPECT_EQ(out[0]["message"], "Unknown command: warp_time");
    EXPECT_EQ(out[1]["error_kind"], "host_error");
    EXPECT_EQ(out[1]["message"], "Track index out of range");
  }

  TEST_F(TcpConnectionTest, request_split_into_single_bytes_is_dispatched_once) {
    const std::string msg = "{\"type\":\"set_track_name\",\"params\":{\"name\":\"}{\\\"\"}}\n";
    for (char c : msg)
      socket->pushData(std::string(1, c));
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["status"], "success");
    EXPECT_EQ(out[0]["result"]["params"]["name"], "}{\"");
    EXPECT_EQ(host->calls().size(), 1u);
  }

  TEST_F(TcpConnectionTest, array_message_is_one_parse_error_and_never_executes) {
    socket->pushData("[{\"type\":\"delete_all_tracks\"}]\n");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["error_kind"], "parse_error");
    EXPECT_TRUE(host->calls().empty());
  }

  TEST_F(TcpConnectionTest, mismatched_brackets_are_one_parse_error_and_never_execute) {
    socket->pushData("{\"type\":\"undo\"]}");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["error_kind"], "parse_error");
    EXPECT_TRUE(host->calls().empty());
  }

  TEST_F(TcpConnectionTest, oversized_message_is_rejected) {
    socket->pushData("{\"type\":\"set_track_name\",\"params\":{\"name\":\"" + std::string(4096, 'n') +
                     "\"}}");
    socket->pushData("{\"type\":\"undo\"}");
    connection->run(keepRunning);

    const auto out = replies();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0]["error_kind"], "parse_error");
    EXPECT_EQ(out[1]["status"], "success");
  }

  TEST_F(TcpConnectionTest, write_failure_ends_the_connection) {
    socket->writeSucceeds = false;
    socket->pushData("{\"type\":\"undo\"}{\"type\":\"redo\"}");
    connection->run(keepRunning);

    EXPECT_EQ(socket->written.size(), 1u);
    EXPECT_TRUE(connection->finished());
  }

  TEST_F(TcpConnectionTest, read_error_and_stop_flag_end_the_loop) {
    socket->script.push_back({ StreamSocket::ReadStatus::Timeout });
    socket->script.push_back({ StreamSocket::ReadStatus::Error });
    socket->pushData("{\"type\":\"undo\"}");
    connection->run(keepRunning);
    EXPECT_TRUE(socket->written.empty());

    keepRunning = false;
    auto again = std::make_unique<FakeStreamSocket>();
    again->pushData("{\"type\":\"undo\"}");
    TcpConnection stopped(std::move(again), *dispatcher, logger, "stopped-peer", 1024, 10ms);
    stopped.run(keepRunning);
    EXPECT_TRUE(stopped.finished());
    EXPECT_EQ(stopped.requestsHandled(), 0u);
  }

} // namespace cuebridge::test
