/* @file CommandKind.cpp
 * @brief wire-name table for the command catalog
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// cuebridge headers
#include "core/CommandKind.hpp"

namespace cuebridge {
  namespace core {

    namespace {
      // index == static_cast<size_t>(CommandKind)
      constexpr std::array<std::string_view, kCommandKindCount> kNames{
        "set_track_volume",
        "set_track_pan",
        "set_track_mute",
        "set_track_solo",
        "set_track_arm",
        "set_device_parameter",
        "set_send_amount",
        "set_master_volume",
        "set_clip_launch_mode",
        "fire_clip",
        "get_session_info",
        "get_track_info",
        "get_all_tracks",
        "get_device_parameters",
        "get_clip_notes",
        "get_playhead_position",
        "create_midi_track",
        "create_audio_track",
        "delete_track",
        "delete_all_tracks",
        "set_track_name",
        "create_clip",
        "delete_clip",
        "add_notes_to_clip",
        "set_clip_name",
        "stop_clip",
        "set_tempo",
        "start_playback",
        "stop_playback",
        "toggle_device_bypass",
        "create_scene",
        "delete_scene",
        "fire_scene",
        "set_playhead_position",
        "create_locator",
        "delete_locator",
        "set_loop",
        "undo",
        "redo",
      };

      std::array<CommandKind, kCommandKindCount> makeAllKinds() {
        std::array<CommandKind, kCommandKindCount> kinds{};
        for (std::size_t i = 0; i < kCommandKindCount; ++i)
          kinds[i] = static_cast<CommandKind>(i);
        return kinds;
      }
    } // namespace

    std::string_view toString(CommandKind kind) {
      const auto index = static_cast<std::size_t>(kind);
      if (index >= kCommandKindCount)
        return "unknown";
      return kNames[index];
    }

    std::optional<CommandKind> commandKindFromString(std::string_view name) {
      for (std::size_t i = 0; i < kCommandKindCount; ++i) {
        if (kNames[i] == name)
          return static_cast<CommandKind>(i);
      }
      return std::nullopt;
    }

    const std::array<CommandKind, kCommandKindCount>& allCommandKinds() {
      static const auto kinds = makeAllKinds();
      return kinds;
    }

  } // namespace core
} // namespace cuebridge
