#pragma once
/** @file  CommandKind.hpp
 *  @brief Closed catalog of host operations the bridge can dispatch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cuebridge {
  namespace core {

    enum class CommandKind : std::uint8_t {
      // mixer / device control (high-frequency, reversible)
      SetTrackVolume,
      SetTrackPan,
      SetTrackMute,
      SetTrackSolo,
      SetTrackArm,
      SetDeviceParameter,
      SetSendAmount,
      SetMasterVolume,
      SetClipLaunchMode,
      FireClip,
      // queries
      GetSessionInfo,
      GetTrackInfo,
      GetAllTracks,
      GetDeviceParameters,
      GetClipNotes,
      GetPlayheadPosition,
      // structure / transport (critical)
      CreateMidiTrack,
      CreateAudioTrack,
      DeleteTrack,
      DeleteAllTracks,
      SetTrackName,
      CreateClip,
      DeleteClip,
      AddNotesToClip,
      SetClipName,
      StopClip,
      SetTempo,
      StartPlayback,
      StopPlayback,
      ToggleDeviceBypass,
      CreateScene,
      DeleteScene,
      FireScene,
      SetPlayheadPosition,
      CreateLocator,
      DeleteLocator,
      SetLoop,
      Undo,
      Redo,
      Count
    };
    static_assert(static_cast<std::uint8_t>(CommandKind::Count) == 39,
                  "CommandKind count changed please update the classification table");

    inline constexpr std::size_t kCommandKindCount = static_cast<std::size_t>(CommandKind::Count);

    /// Wire name of \p kind ("set_track_volume", ...).
    std::string_view toString(CommandKind kind);

    /// Reverse lookup; std::nullopt for anything outside the catalog.
    std::optional<CommandKind> commandKindFromString(std::string_view name);

    /// Every catalog entry in declaration order.
    const std::array<CommandKind, kCommandKindCount>& allCommandKinds();

  } // namespace core
} // namespace cuebridge
