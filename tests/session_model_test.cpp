// cuebridge-Prod headers
#include "host/SessionModel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <limits>
#include <string>

namespace cuebridge::test {

  using core::CommandKind;
  using core::HostError;
  using host::SessionModel;
  using nlohmann::json;

  class SessionModelTest : public ::testing::Test {
  protected:
    json run(CommandKind kind, json params = json::object()) {
      return session.invoke(kind, params);
    }

    std::string failureOf(CommandKind kind, json params = json::object()) {
      try {
        session.invoke(kind, params);
      } catch (const HostError& e) {
        return e.what();
      }
      return "<no error>";
    }

    SessionModel session;
  };

  TEST_F(SessionModelTest, default_set_shape) {
    auto info = run(CommandKind::GetSessionInfo);
    EXPECT_EQ(info["tempo"], 120.0);
    EXPECT_EQ(info["signature_numerator"], 4);
    EXPECT_EQ(info["track_count"], 4);
    EXPECT_EQ(info["return_track_count"], 2);
    EXPECT_EQ(info["scene_count"], 8);
    EXPECT_EQ(info["master_track"]["name"], "Master");

    auto all = run(CommandKind::GetAllTracks);
    ASSERT_EQ(all["count"], 4);
    EXPECT_EQ(all["tracks"][0]["name"], "1-MIDI");
    EXPECT_EQ(all["tracks"][2]["is_audio"], true);
  }

  TEST_F(SessionModelTest, missing_params_use_protocol_defaults) {
    auto vol = run(CommandKind::SetTrackVolume); // track_index 0, volume 0.75
    EXPECT_EQ(vol["track_name"], "1-MIDI");
    EXPECT_EQ(vol["volume"], 0.75);

    EXPECT_EQ(run(CommandKind::SetTempo)["tempo"], 120.0);
    EXPECT_EQ(run(CommandKind::CreateClip)["length"], 4.0);

    auto loop = run(CommandKind::SetLoop);
    EXPECT_EQ(loop["start_bar"], 1);
    EXPECT_EQ(loop["end_bar"], 17);
    EXPECT_EQ(loop["enabled"], true);
  }

  TEST_F(SessionModelTest, index_errors_use_host_wording) {
    EXPECT_EQ(failureOf(CommandKind::SetTrackVolume, { { "track_index", 10 } }),
              "Track index out of range");
    EXPECT_EQ(failureOf(CommandKind::GetTrackInfo, { { "track_index", -1 } }),
              "Track index out of range");
    EXPECT_EQ(failureOf(CommandKind::FireClip, { { "clip_index", 99 } }), "Clip index out of range");
    EXPECT_EQ(failureOf(CommandKind::FireClip), "No clip in slot");
    EXPECT_EQ(failureOf(CommandKind::SetDeviceParameter, { { "track_index", 2 } }),
              "Device index out of range");
    EXPECT_EQ(failureOf(CommandKind::SetDeviceParameter, { { "parameter_index", 50 } }),
              "Parameter index out of range");
    EXPECT_EQ(failureOf(CommandKind::FireScene, { { "scene_index", 8 } }), "Scene index out of range");
    EXPECT_EQ(failureOf(CommandKind::DeleteLocator), "Locator index out of range");
    EXPECT_EQ(failureOf(CommandKind::SetSendAmount, { { "send_index", 2 } }), "Send index out of range");
  }

  TEST_F(SessionModelTest, wrong_param_types_are_host_errors) {
    EXPECT_THAT(failureOf(CommandKind::SetTrackVolume, { { "volume", "loud" } }),
                ::testing::HasSubstr("'volume'"));
    EXPECT_THAT(failureOf(CommandKind::SetTrackName, { { "name", 5 } }),
                ::testing::HasSubstr("'name'"));
    EXPECT_THAT(failureOf(CommandKind::AddNotesToClip, { { "notes", "C4" } }),
                ::testing::HasSubstr("'notes'"));
  }

  TEST_F(SessionModelTest, integers_beyond_64_bits_are_rejected_not_converted) {
    EXPECT_EQ(failureOf(CommandKind::SetTrackVolume, { { "track_index", 1e300 } }),
              "Parameter 'track_index' is out of range");
    EXPECT_EQ(failureOf(CommandKind::DeleteTrack, { { "track_index", -1e19 } }),
              "Parameter 'track_index' is out of range");
    EXPECT_EQ(failureOf(CommandKind::GetTrackInfo,
                        { { "track_index", json::parse("18446744073709551615") } }),
              "Parameter 'track_index' is out of range");
    EXPECT_EQ(failureOf(CommandKind::GetTrackInfo, { { "track_index", 9.223372036854775807e18 } }),
              "Parameter 'track_index' is out of range");
    // whole-valued floats inside the range still address tracks
    EXPECT_EQ(run(CommandKind::GetTrackInfo, { { "track_index", 1.0 } })["index"], 1);
  }

  TEST_F(SessionModelTest, values_stored_as_int_are_bounded_before_narrowing) {
    run(CommandKind::CreateClip, { { "clip_index", 0 } });
    // 4294967296 + 60 would wrap to 60 in a 32-bit int
    EXPECT_EQ(failureOf(CommandKind::AddNotesToClip,
                        { { "notes", json::array({ { { "pitch", 4294967356LL } } }) } }),
              "Note pitch out of range");
    EXPECT_EQ(failureOf(CommandKind::AddNotesToClip,
                        { { "notes", json::array({ { { "velocity", -4294967196LL } } }) } }),
              "Note velocity out of range");
    EXPECT_TRUE(session.state().tracks[0].slots[0]->notes.empty());

    EXPECT_EQ(failureOf(CommandKind::SetLoop, { { "start_bar", 1 }, { "end_bar", 4294967296LL } }),
              "Loop end out of range");
    EXPECT_EQ(failureOf(CommandKind::CreateLocator, { { "bar", 4294967297LL } }), "Bar out of range");
    EXPECT_EQ(failureOf(CommandKind::SetPlayheadPosition, { { "bar", 1e18 } }), "Bar out of range");
    EXPECT_TRUE(session.state().locators.empty());
  }

  TEST_F(SessionModelTest, note_window_tolerates_extreme_bounds) {
    run(CommandKind::CreateClip, { { "clip_index", 0 } });
    run(CommandKind::AddNotesToClip,
        { { "notes", json::array({ { { "pitch", 0 } }, { { "pitch", 127 } } }) } });

    const auto max = std::numeric_limits<long long>::max();
    const auto min = std::numeric_limits<long long>::min();
    EXPECT_EQ(run(CommandKind::GetClipNotes, { { "from_pitch", 100 }, { "pitch_span", max } })["count"], 1);
    EXPECT_EQ(run(CommandKind::GetClipNotes, { { "from_pitch", min }, { "pitch_span", max } })["count"], 2);
    EXPECT_EQ(run(CommandKind::GetClipNotes, { { "from_pitch", max } })["count"], 0);
  }

  TEST_F(SessionModelTest, track_lifecycle) {
    auto created = run(CommandKind::CreateMidiTrack, { { "index", 1 } });
    EXPECT_EQ(created["index"], 1);
    EXPECT_EQ(created["name"], "2-MIDI");
    EXPECT_EQ(run(CommandKind::CreateAudioTrack)["index"], 5);

    run(CommandKind::SetTrackName, { { "track_index", 1 }, { "name", "Keys" } });
    auto deleted = run(CommandKind::DeleteTrack, { { "track_index", 1 } });
    EXPECT_EQ(deleted["deleted_index"], 1);
    EXPECT_EQ(deleted["deleted_track"], "Keys");

    EXPECT_EQ(run(CommandKind::DeleteAllTracks)["deleted_count"], 5);
    EXPECT_EQ(run(CommandKind::GetSessionInfo)["track_count"], 0);
    EXPECT_EQ(failureOf(CommandKind::CreateMidiTrack, { { "index", 3 } }), "Track index out of range");
  }

  TEST_F(SessionModelTest, clips_and_notes) {
    run(CommandKind::CreateClip, { { "track_index", 0 }, { "clip_index", 2 }, { "length", 8.0 } });
    EXPECT_EQ(failureOf(CommandKind::CreateClip, { { "clip_index", 2 } }),
              "Clip slot already has a clip");
    EXPECT_EQ(failureOf(CommandKind::CreateClip, { { "track_index", 2 } }),
              "Cannot create a MIDI clip on an audio track");

    auto added = run(CommandKind::AddNotesToClip,
                     { { "clip_index", 2 },
                       { "notes", json::array({ { { "pitch", 64 }, { "start_time", 1.0 } },
                                                { { "pitch", 67 }, { "velocity", 90 } } }) } });
    EXPECT_EQ(added["note_count"], 2);

    auto notes = run(CommandKind::GetClipNotes, { { "clip_index", 2 } });
    ASSERT_EQ(notes["count"], 2);
    EXPECT_EQ(notes["notes"][0]["pitch"], 64);
    EXPECT_EQ(notes["notes"][0]["duration"], 0.25);
    EXPECT_EQ(notes["notes"][1]["velocity"], 90);

    auto windowed = run(CommandKind::GetClipNotes, { { "clip_index", 2 }, { "from_pitch", 65 } });
    EXPECT_EQ(windowed["count"], 1);

    EXPECT_EQ(failureOf(CommandKind::AddNotesToClip,
                        { { "clip_index", 2 }, { "notes", json::array({ { { "pitch", 200 } } }) } }),
              "Note pitch out of range");

    EXPECT_EQ(run(CommandKind::SetClipName, { { "clip_index", 2 }, { "name", "Hook" } })["name"],
              "Hook");
    EXPECT_EQ(run(CommandKind::SetClipLaunchMode, { { "clip_index", 2 }, { "mode", 2 } })["launch_mode"],
              2);
    EXPECT_EQ(run(CommandKind::FireClip, { { "clip_index", 2 } })["fired"], true);
    EXPECT_TRUE(session.state().playing);
    EXPECT_EQ(run(CommandKind::StopClip, { { "clip_index", 2 } })["stopped"], true);

    auto deleted = run(CommandKind::DeleteClip, { { "clip_index", 2 } });
    EXPECT_EQ(deleted["deleted"], true);
    EXPECT_EQ(failureOf(CommandKind::GetClipNotes, { { "clip_index", 2 } }), "No clip in slot");
  }

  TEST_F(SessionModelTest, devices) {
    auto params = run(CommandKind::GetDeviceParameters);
    EXPECT_EQ(params["device_name"], "Operator");
    ASSERT_GE(params["parameters"].size(), 2u);
    EXPECT_EQ(params["parameters"][0]["name"], "Device On");

    auto set = run(CommandKind::SetDeviceParameter, { { "parameter_index", 1 }, { "value", 0.4 } });
    EXPECT_EQ(set["parameter_name"], "Volume");
    EXPECT_EQ(set["value"], 0.4);
    EXPECT_EQ(failureOf(CommandKind::SetDeviceParameter, { { "parameter_index", 1 }, { "value", 3.0 } }),
              "Parameter value out of range");

    auto bypass = run(CommandKind::ToggleDeviceBypass, { { "enabled", false } });
    EXPECT_EQ(bypass["bypass_enabled"], 0.0);
    EXPECT_EQ(session.state().tracks[0].devices[0].parameters[0].value, 0.0);
  }

  TEST_F(SessionModelTest, mixer_values_are_clamped) {
    EXPECT_EQ(run(CommandKind::SetTrackPan, { { "pan", -3.0 } })["pan"], -1.0);
    EXPECT_EQ(run(CommandKind::SetMasterVolume, { { "volume", 1.5 } })["volume"], 1.0);
    EXPECT_EQ(run(CommandKind::SetSendAmount, { { "send_index", 1 }, { "amount", 0.6 } })["amount"], 0.6);
    EXPECT_EQ(run(CommandKind::SetTrackMute, { { "mute", true } })["mute"], true);
    EXPECT_EQ(run(CommandKind::SetTrackSolo, { { "solo", true } })["solo"], true);
    EXPECT_EQ(run(CommandKind::SetTrackArm, { { "arm", true } })["arm"], true);
  }

  TEST_F(SessionModelTest, scenes_keep_slots_aligned) {
    EXPECT_EQ(run(CommandKind::CreateScene)["scene_index"], 8);
    EXPECT_EQ(run(CommandKind::CreateScene, { { "index", 0 } })["scene_index"], 0);
    for (const auto& t : session.state().tracks)
      EXPECT_EQ(t.slots.size(), 10u);

    run(CommandKind::CreateClip, { { "clip_index", 3 } });
    EXPECT_EQ(run(CommandKind::FireScene, { { "scene_index", 3 } })["fired_scene_index"], 3);
    EXPECT_TRUE(session.state().tracks[0].slots[3]->playing);

    EXPECT_EQ(run(CommandKind::DeleteScene, { { "scene_index", 3 } })["deleted_scene_index"], 3);
    EXPECT_EQ(session.state().tracks[0].slots.size(), 9u);
    EXPECT_FALSE(session.state().tracks[0].slots[3].has_value());
  }

  TEST_F(SessionModelTest, last_scene_cannot_be_deleted) {
    SessionModel single(std::chrono::milliseconds{ 0 }, 1);
    EXPECT_THROW(single.invoke(CommandKind::DeleteScene, json::object()), HostError);
  }

  TEST_F(SessionModelTest, transport_playhead_locators) {
    EXPECT_EQ(run(CommandKind::StartPlayback)["playing"], true);
    EXPECT_EQ(run(CommandKind::StopPlayback)["playing"], false);

    run(CommandKind::SetPlayheadPosition, { { "bar", 3 }, { "beat", 2.5 } });
    auto pos = run(CommandKind::GetPlayheadPosition);
    EXPECT_EQ(pos["bars"], 3);
    EXPECT_EQ(pos["beats"], 3);
    EXPECT_EQ(pos["sub_division"], 3);
    EXPECT_EQ(pos["song_time"], 10.5);
    EXPECT_EQ(failureOf(CommandKind::SetPlayheadPosition, { { "bar", 0 } }), "Bar must be 1 or greater");

    auto loc = run(CommandKind::CreateLocator, { { "bar", 9 }, { "name", "Drop" } });
    EXPECT_EQ(loc["created"], true);
    EXPECT_EQ(loc["name"], "Drop");
    run(CommandKind::CreateLocator, { { "bar", 5 }, { "name", "Build" } });
    EXPECT_EQ(session.state().locators[0].name, "Build");
    EXPECT_EQ(run(CommandKind::DeleteLocator, { { "locator_index", 0 } })["deleted_locator_index"], 0);

    EXPECT_EQ(failureOf(CommandKind::SetLoop, { { "start_bar", 9 }, { "end_bar", 5 } }),
              "Loop end must be after loop start");
    EXPECT_EQ(failureOf(CommandKind::SetTempo, { { "tempo", 5000 } }), "Tempo out of range");
  }

  TEST_F(SessionModelTest, undo_and_redo_restore_edits_but_not_transport) {
    run(CommandKind::SetTempo, { { "tempo", 90.0 } });
    run(CommandKind::SetTrackName, { { "name", "Drums" } });
    run(CommandKind::StartPlayback);

    EXPECT_EQ(run(CommandKind::Undo)["undone"], true);
    EXPECT_EQ(session.state().tracks[0].name, "1-MIDI");
    EXPECT_EQ(session.state().tempo, 90.0);
    EXPECT_TRUE(session.state().playing);

    EXPECT_EQ(run(CommandKind::Redo)["redone"], true);
    EXPECT_EQ(session.state().tracks[0].name, "Drums");
    EXPECT_EQ(failureOf(CommandKind::Redo), "Nothing to redo");

    run(CommandKind::Undo);
    run(CommandKind::Undo);
    EXPECT_EQ(session.state().tempo, 120.0);
    EXPECT_EQ(failureOf(CommandKind::Undo), "Nothing to undo");
  }

  TEST_F(SessionModelTest, rejected_command_leaves_no_undo_step) {
    EXPECT_EQ(session.undoDepth(), 0u);
    failureOf(CommandKind::SetTrackVolume, { { "track_index", 77 } });
    failureOf(CommandKind::SetTempo, { { "tempo", 1.0 } });
    EXPECT_EQ(session.undoDepth(), 0u);
    run(CommandKind::SetTrackVolume, { { "volume", 0.1 } });
    EXPECT_EQ(session.undoDepth(), 1u);
  }

  TEST_F(SessionModelTest, history_is_bounded) {
    for (int i = 0; i < 100; ++i)
      run(CommandKind::SetTrackVolume, { { "volume", (i % 10) / 10.0 } });
    EXPECT_EQ(session.undoDepth(), 64u);
  }

  TEST_F(SessionModelTest, every_catalog_command_is_handled) {
    // each kind either succeeds or fails with a HostError, never "Unsupported command"
    for (auto kind : core::allCommandKinds()) {
      SessionModel fresh;
      try {
        fresh.invoke(kind, json::object());
      } catch (const HostError& e) {
        EXPECT_THAT(e.what(), ::testing::Not(::testing::HasSubstr("Unsupported"))) << core::toString(kind);
      }
    }
  }

} // namespace cuebridge::test
