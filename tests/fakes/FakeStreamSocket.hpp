#pragma once
/** @file  FakeStreamSocket.hpp
 *  @brief StreamSocket derivative with scripted reads and captured writes for TcpConnection testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <string>
#include <vector>

#include "io/StreamSocket.hpp"

namespace cuebridge {
  namespace test {

    class FakeStreamSocket : public io::StreamSocket {
    public:
      std::deque<ReadResult> script; ///< played back in order; Closed once exhausted
      std::vector<std::string> written;
      bool writeSucceeds = true;
      bool shutdownCalled = false;

      void pushData(std::string bytes) {
        script.push_back(ReadResult{ ReadStatus::Data, std::move(bytes) });
      }

      ReadResult read(std::chrono::milliseconds) override {
        if (script.empty())
          return ReadResult{ ReadStatus::Closed };
        auto next = std::move(script.front());
        script.pop_front();
        return next;
      }

      bool writeAll(std::string_view data) override {
        written.emplace_back(data);
        return writeSucceeds;
      }

      void shutdown() override { shutdownCalled = true; }
    };

  } // namespace test
} // namespace cuebridge
