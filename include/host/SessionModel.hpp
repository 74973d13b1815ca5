#pragma once
/** @file  SessionModel.hpp
 *  @brief In-process Live-style session: the HostApi the daemon ships with.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cuebridge headers
#include "core/HostApi.hpp"

namespace cuebridge {
  namespace host {

    struct DeviceParameter {
      std::string name;
      double value{ 0.0 };
      double min{ 0.0 };
      double max{ 1.0 };
      bool quantized{ false };
    };

    struct Device {
      std::string name;
      std::string className;
      std::string type; ///< "instrument" | "audio_effect" | "midi_effect"
      std::vector<DeviceParameter> parameters; ///< [0] is always "Device On"
    };

    struct Note {
      int pitch{ 60 };
      double startTime{ 0.0 };
      double duration{ 0.25 };
      int velocity{ 100 };
      bool mute{ false };
    };

    struct Clip {
      std::string name;
      double length{ 4.0 };
      int launchMode{ 0 }; ///< 0 Trigger, 1 Gate, 2 Toggle, 3 Repeat
      bool playing{ false };
      std::vector<Note> notes;
    };

    struct Track {
      std::string name;
      bool midi{ true };
      double volume{ 0.85 };
      double pan{ 0.0 };
      bool mute{ false };
      bool solo{ false };
      bool arm{ false };
      std::vector<double> sends;              ///< one per return track
      std::vector<Device> devices;
      std::vector<std::optional<Clip>> slots; ///< one per scene
    };

    struct Locator {
      std::string name;
      int bar{ 1 };
    };

    struct SessionState {
      double tempo{ 120.0 };
      int signatureNumerator{ 4 };
      int signatureDenominator{ 4 };
      bool playing{ false };
      double songTime{ 0.0 }; ///< playhead, in beats from the start
      int loopStartBar{ 1 };
      int loopEndBar{ 17 };
      bool loopEnabled{ false };
      double masterVolume{ 0.85 };
      double masterPan{ 0.0 };
      std::vector<std::string> returnTracks;
      std::vector<Track> tracks;
      std::vector<std::string> scenes;
      std::vector<Locator> locators;
    };

    /**
 * @class SessionModel
 * @brief Applies catalog commands to an in-memory set.
 *
 *  * Parameter names and defaults follow the remote-script protocol
 *    (`track_index` 0, `volume` 0.75, `length` 4.0, `index` -1, ...).
 *  * Bad indices raise core::HostError("Track index out of range", ...).
 *  * Every edit of the set is undoable; transport and launch state are not.
 *  * Not thread-safe: exactly one ExecutionSerializer drives it.
 */
    class SessionModel : public core::HostApi {
    public:
      explicit SessionModel(std::chrono::milliseconds latency = std::chrono::milliseconds{ 0 },
                            std::size_t sceneCount = 8);

      nlohmann::json invoke(core::CommandKind kind, const nlohmann::json& params) override;

      const SessionState& state() const noexcept { return state_; }
      std::size_t undoDepth() const noexcept { return undo_.size(); }
      std::size_t redoDepth() const noexcept { return redo_.size(); }

    private:
      static constexpr std::size_t kUndoLimit = 64;

      nlohmann::json apply(core::CommandKind kind, const nlohmann::json& params);
      void checkpoint();

      Track& track(long long index);
      Device& device(Track& t, long long index);
      std::optional<Clip>& slot(Track& t, long long index);
      Clip& clip(Track& t, long long index); ///< throws "No clip in slot"

      Track makeTrack(bool midi, std::size_t position) const;
      long long insertTrack(bool midi, long long index);

      nlohmann::json sessionInfo() const;
      nlohmann::json trackInfo(long long index);

      std::chrono::milliseconds latency_;
      SessionState state_;
      std::deque<SessionState> undo_;
      std::deque<SessionState> redo_;
    };

  } // namespace host
} // namespace cuebridge
