// cuebridge-Prod headers
#include "protocols/JsonStreamFramer.hpp"
#include "protocols/ProtocolError.hpp"
#include "protocols/Request.hpp"
#include "protocols/Response.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <string>
#include <vector>

namespace cuebridge::test {

  using nlohmann::json;
  using protocols::ErrorKind;
  using protocols::Frame;
  using protocols::JsonStreamFramer;
  using protocols::ProtocolError;
  using protocols::Request;
  using protocols::Response;

  namespace {
    std::vector<Frame> drain(JsonStreamFramer& framer) {
      std::vector<Frame> frames;
      while (auto f = framer.next())
        frames.push_back(std::move(*f));
      return frames;
    }

    ErrorKind parseFailureKind(const std::string& text) {
      try {
        Request::fromWire(text);
      } catch (const ProtocolError& e) {
        return e.kind();
      }
      ADD_FAILURE() << "no ProtocolError for " << text;
      return ErrorKind::HostError;
    }
  } // namespace

  //---Request-------------------------------------------------------------

  TEST(request, decodes_type_and_params) {
    auto req = Request::fromWire(R"({"type":"set_track_volume","params":{"track_index":2,"volume":0.5}})");
    EXPECT_EQ(req.type, "set_track_volume");
    EXPECT_EQ(req.params.at("track_index"), 2);
    EXPECT_DOUBLE_EQ(req.params.at("volume").get<double>(), 0.5);
  }

  TEST(request, missing_or_null_params_become_empty_object) {
    EXPECT_EQ(Request::fromWire(R"({"type":"undo"})").params, json::object());
    EXPECT_EQ(Request::fromWire(R"({"type":"undo","params":null})").params, json::object());
  }

  TEST(request, malformed_messages_are_parse_errors) {
    EXPECT_EQ(parseFailureKind("{\"type\": \"undo\""), ErrorKind::ParseError);
    EXPECT_EQ(parseFailureKind("[1,2,3]"), ErrorKind::ParseError);
    EXPECT_EQ(parseFailureKind(R"({"params":{}})"), ErrorKind::ParseError);
    EXPECT_EQ(parseFailureKind(R"({"type":42})"), ErrorKind::ParseError);
    EXPECT_EQ(parseFailureKind(R"({"type":"undo","params":[1]})"), ErrorKind::ParseError);
    EXPECT_EQ(parseFailureKind(""), ErrorKind::ParseError);
  }

  TEST(request, to_wire_is_parseable_again) {
    Request req{ "set_tempo", { { "tempo", 128.0 } } };
    auto back = Request::fromWire(req.toWire());
    EXPECT_EQ(back.type, "set_tempo");
    EXPECT_EQ(back.params, req.params);
  }

  //---Response------------------------------------------------------------

  TEST(response, success_envelope_shape) {
    const auto wire = Response::success({ { "tempo", 120.0 } }).toWire();
    ASSERT_FALSE(wire.empty());
    EXPECT_EQ(wire.back(), '\n');
    const auto doc = json::parse(wire);
    EXPECT_EQ(doc.at("status"), "success");
    EXPECT_EQ(doc.at("result").at("tempo"), 120.0);
    EXPECT_FALSE(doc.contains("message"));
  }

  TEST(response, null_result_is_an_empty_object) {
    const auto doc = json::parse(Response::success(nullptr).toWire());
    EXPECT_EQ(doc.at("result"), json::object());
  }

  TEST(response, error_envelope_carries_kind) {
    const auto doc =
        json::parse(Response::failure(ErrorKind::UnknownCommand, "Unknown command: foo").toWire());
    EXPECT_EQ(doc.at("status"), "error");
    EXPECT_EQ(doc.at("message"), "Unknown command: foo");
    EXPECT_EQ(doc.at("error_kind"), "unknown_command");
    EXPECT_FALSE(doc.contains("result"));
  }

  TEST(response, invalid_utf8_from_host_does_not_throw) {
    const auto resp = Response::success({ { "name", std::string("bad \xff name") } });
    EXPECT_NO_THROW(resp.toWire());
  }

  TEST(response, client_side_decode) {
    auto ok = Response::fromWire(R"({"status":"success","result":{"fired":true}})");
    ASSERT_TRUE(ok);
    EXPECT_TRUE(ok->ok());
    EXPECT_EQ(ok->result.at("fired"), true);

    auto err = Response::fromWire(R"({"status":"error","message":"x","error_kind":"timeout_error"})");
    ASSERT_TRUE(err);
    EXPECT_FALSE(err->ok());
    EXPECT_EQ(err->errorKind, ErrorKind::TimeoutError);

    EXPECT_FALSE(Response::fromWire("not json"));
    EXPECT_FALSE(Response::fromWire(R"({"status":"maybe"})"));
  }

  TEST(error_kind, names_round_trip) {
    for (auto kind : { ErrorKind::ParseError, ErrorKind::UnknownCommand,
                       ErrorKind::TransportNotAllowed, ErrorKind::HostError,
                       ErrorKind::TimeoutError, ErrorKind::Shutdown })
      EXPECT_EQ(protocols::errorKindFromString(protocols::toString(kind)), kind);
  }

  //---JsonStreamFramer----------------------------------------------------

  TEST(json_stream_framer, one_object_fed_byte_by_byte_yields_one_frame) {
    const std::string msg = R"({"type":"set_track_name","params":{"name":"a {weird} \"name\""}})";
    JsonStreamFramer framer;
    std::vector<Frame> frames;
    for (char c : msg) {
      framer.feed(std::string_view(&c, 1));
      for (auto& f : drain(framer))
        frames.push_back(std::move(f));
    }
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_TRUE(frames[0].valid());
    EXPECT_EQ(frames[0].text, msg);
    EXPECT_EQ(framer.buffered(), 0u);
  }

  TEST(json_stream_framer, back_to_back_and_newline_delimited_objects) {
    JsonStreamFramer framer;
    framer.feed("{\"type\":\"undo\"}{\"type\":\"redo\"}\n  {\"type\":\"get_session_info\"}\r\n");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].text, "{\"type\":\"undo\"}");
    EXPECT_EQ(frames[1].text, "{\"type\":\"redo\"}");
    EXPECT_EQ(frames[2].text, "{\"type\":\"get_session_info\"}");
  }

  TEST(json_stream_framer, partial_object_waits_for_more_bytes) {
    JsonStreamFramer framer;
    framer.feed("{\"type\":\"set_tempo\",\"params\":{\"tempo\":");
    EXPECT_FALSE(framer.next());
    framer.feed("140}}");
    auto frame = framer.next();
    ASSERT_TRUE(frame);
    EXPECT_EQ(Request::fromWire(frame->text).params.at("tempo"), 140);
  }

  TEST(json_stream_framer, junk_line_is_reported_once_and_stream_recovers) {
    JsonStreamFramer framer;
    framer.feed("hello there\n{\"type\":\"undo\"}");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_TRUE(frames[1].valid());
    EXPECT_EQ(frames[1].text, "{\"type\":\"undo\"}");
  }

  TEST(json_stream_framer, junk_split_across_reads_is_still_one_report) {
    JsonStreamFramer framer;
    framer.feed("garb");
    auto first = drain(framer);
    framer.feed("age\n{\"type\":\"redo\"}");
    auto second = drain(framer);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_FALSE(first[0].valid());
    ASSERT_EQ(second.size(), 1u);
    EXPECT_TRUE(second[0].valid());
  }

  TEST(json_stream_framer, top_level_array_is_one_invalid_frame_and_nothing_inside_is_framed) {
    JsonStreamFramer framer;
    framer.feed("[{\"type\":\"delete_all_tracks\"}, [\"]\"]]\n{\"type\":\"undo\"}");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_TRUE(frames[1].valid());
    EXPECT_EQ(frames[1].text, "{\"type\":\"undo\"}");
  }

  TEST(json_stream_framer, junk_line_hides_objects_on_the_same_line) {
    JsonStreamFramer framer;
    framer.feed("42 {\"type\":\"delete_all_tracks\"}\n");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_EQ(framer.buffered(), 0u);
  }

  TEST(json_stream_framer, mismatched_closer_is_one_invalid_frame) {
    JsonStreamFramer framer;
    framer.feed("{\"type\":\"undo\"]}{\"type\":\"redo\"}");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_THAT(frames[0].text, ::testing::HasSubstr("Mismatched"));
    EXPECT_EQ(frames[1].text, "{\"type\":\"redo\"}");
  }

  TEST(json_stream_framer, unbalanced_mismatch_recovers_at_end_of_line) {
    JsonStreamFramer framer;
    framer.feed("{\"params\":[}\n{\"type\":\"redo\"}\n");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_TRUE(frames[1].valid());
  }

  TEST(json_stream_framer, excessive_nesting_is_rejected) {
    JsonStreamFramer framer;
    framer.feed("{\"a\":" + std::string(1000, '[') + "\n{\"type\":\"undo\"}");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_TRUE(frames[1].valid());
  }

  TEST(json_stream_framer, oversized_object_is_rejected_and_followers_survive) {
    JsonStreamFramer framer(64);
    const std::string big = "{\"type\":\"set_track_name\",\"params\":{\"name\":\"" +
                            std::string(200, 'x') + "\"}}";
    framer.feed(big);
    framer.feed("{\"type\":\"undo\"}");
    auto frames = drain(framer);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].valid());
    EXPECT_THAT(frames[0].text, ::testing::HasSubstr("maximum size"));
    EXPECT_TRUE(frames[1].valid());
  }

  TEST(json_stream_framer, invalid_json_inside_braces_is_framed_then_fails_to_parse) {
    JsonStreamFramer framer;
    framer.feed("{not json}");
    auto frame = framer.next();
    ASSERT_TRUE(frame);
    EXPECT_TRUE(frame->valid());
    EXPECT_THROW(Request::fromWire(frame->text), ProtocolError);
  }

} // namespace cuebridge::test
