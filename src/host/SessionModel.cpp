/* @file SessionModel.cpp
 * @brief in-memory session host: catalog commands applied to a Live-style set
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <cmath>
#include <limits>
#include <string>
#include <thread>

// cuebridge headers
#include "host/SessionModel.hpp"

using namespace cuebridge::host;
using cuebridge::core::CommandKind;
using cuebridge::core::HostError;
using nlohmann::json;

namespace {

  constexpr long long kMaxBar = 100000;

  /// Typed lookups with the protocol's fallbacks; a present key of the wrong type is an error.
  class Params {
  public:
    explicit Params(const json& params) : params_(params) {}

    long long integer(const char* key, long long fallback) const {
      const json* v = find(key);
      if (v == nullptr)
        return fallback;
      if (v->is_number_unsigned()) {
        if (v->get<unsigned long long>() >
            static_cast<unsigned long long>(std::numeric_limits<long long>::max()))
          throw HostError(std::string("Parameter '") + key + "' is out of range");
        return v->get<long long>();
      }
      if (v->is_number_integer())
        return v->get<long long>();
      if (v->is_number_float()) {
        // [-2^63, 2^63) is exactly the doubles that convert to long long
        constexpr double kLimit = 9223372036854775808.0;
        const double d = v->get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
          if (d < -kLimit || d >= kLimit)
            throw HostError(std::string("Parameter '") + key + "' is out of range");
          return static_cast<long long>(d);
        }
      }
      throw HostError(std::string("Parameter '") + key + "' must be an integer");
    }

    /// integer() restricted to [lo, hi]; \p error is thrown for anything outside.
    long long integerIn(const char* key, long long lo, long long hi, long long fallback,
                        const char* error) const {
      const auto value = integer(key, fallback);
      if (value < lo || value > hi)
        throw HostError(error);
      return value;
    }

    double number(const char* key, double fallback) const {
      const json* v = find(key);
      if (v == nullptr)
        return fallback;
      if (!v->is_number())
        throw HostError(std::string("Parameter '") + key + "' must be a number");
      const double d = v->get<double>();
      if (!std::isfinite(d))
        throw HostError(std::string("Parameter '") + key + "' must be finite");
      return d;
    }

    bool boolean(const char* key, bool fallback) const {
      const json* v = find(key);
      if (v == nullptr)
        return fallback;
      if (v->is_boolean())
        return v->get<bool>();
      if (v->is_number_integer())
        return v->get<long long>() != 0;
      throw HostError(std::string("Parameter '") + key + "' must be a boolean");
    }

    std::string text(const char* key, const std::string& fallback) const {
      const json* v = find(key);
      if (v == nullptr)
        return fallback;
      if (!v->is_string())
        throw HostError(std::string("Parameter '") + key + "' must be a string");
      return v->get<std::string>();
    }

    json array(const char* key) const {
      const json* v = find(key);
      if (v == nullptr)
        return json::array();
      if (!v->is_array())
        throw HostError(std::string("Parameter '") + key + "' must be an array");
      return *v;
    }

  private:
    const json* find(const char* key) const {
      if (!params_.is_object())
        return nullptr;
      auto it = params_.find(key);
      if (it == params_.end() || it->is_null())
        return nullptr;
      return &*it;
    }

    const json& params_;
  };

  bool inRange(long long index, std::size_t size) {
    return index >= 0 && static_cast<std::size_t>(index) < size;
  }

  double clamp(double v, double lo, double hi) { return std::max(lo, std::min(hi, v)); }

  Device makeInstrument() {
    Device d{ "Operator", "Operator", "instrument", {} };
    d.parameters = {
      { "Device On", 1.0, 0.0, 1.0, true },      { "Volume", 0.7, 0.0, 1.0, false },
      { "Filter Freq", 1.0, 0.0, 1.0, false },   { "Filter Res", 0.0, 0.0, 1.0, false },
      { "Transpose", 0.0, -48.0, 48.0, true },
    };
    return d;
  }

  Note parseNote(const json& raw) {
    if (!raw.is_object())
      throw HostError("Each note must be a JSON object");
    const Params p(raw);
    Note n;
    n.pitch = static_cast<int>(p.integerIn("pitch", 0, 127, 60, "Note pitch out of range"));
    n.startTime = p.number("start_time", 0.0);
    n.duration = p.number("duration", 0.25);
    n.velocity =
        static_cast<int>(p.integerIn("velocity", 0, 127, 100, "Note velocity out of range"));
    n.mute = p.boolean("mute", false);

    if (n.startTime < 0.0)
      throw HostError("Note start_time must not be negative");
    if (n.duration <= 0.0)
      throw HostError("Note duration must be positive");
    return n;
  }

  json noteToJson(const Note& n) {
    return { { "pitch", n.pitch },
             { "start_time", n.startTime },
             { "duration", n.duration },
             { "velocity", n.velocity },
             { "mute", n.mute } };
  }

} // namespace

SessionModel::SessionModel(std::chrono::milliseconds latency, std::size_t sceneCount)
    : latency_(latency) {
  if (sceneCount == 0)
    throw std::invalid_argument("[SessionModel] a session needs at least one scene");

  state_.returnTracks = { "A-Reverb", "B-Delay" };
  state_.scenes.assign(sceneCount, std::string{});
  // Live's default set: two MIDI tracks, two audio tracks
  state_.tracks.push_back(makeTrack(true, 0));
  state_.tracks.push_back(makeTrack(true, 1));
  state_.tracks.push_back(makeTrack(false, 2));
  state_.tracks.push_back(makeTrack(false, 3));
}

json SessionModel::invoke(CommandKind kind, const json& params) {
  if (latency_.count() > 0)
    std::this_thread::sleep_for(latency_);
  return apply(kind, params);
}

// -------------------------------------------------------------------
// SessionModel::apply
// Validate first, then checkpoint(), then mutate: a rejected command
// never leaves an undo step behind.
// -------------------------------------------------------------------
json SessionModel::apply(CommandKind kind, const json& params) {
  const Params p(params);

  switch (kind) {
    //---mixer / device-------------------------------------------------
    case CommandKind::SetTrackVolume: {
      auto& t = track(p.integer("track_index", 0));
      const double volume = clamp(p.number("volume", 0.75), 0.0, 1.0);
      checkpoint();
      t.volume = volume;
      return { { "track_name", t.name }, { "volume", t.volume } };
    }
    case CommandKind::SetTrackPan: {
      const auto index = p.integer("track_index", 0);
      auto& t = track(index);
      const double pan = clamp(p.number("pan", 0.0), -1.0, 1.0);
      checkpoint();
      t.pan = pan;
      return { { "track_index", index }, { "pan", t.pan } };
    }
    case CommandKind::SetTrackMute: {
      auto& t = track(p.integer("track_index", 0));
      const bool mute = p.boolean("mute", false);
      checkpoint();
      t.mute = mute;
      return { { "track_name", t.name }, { "mute", t.mute } };
    }
    case CommandKind::SetTrackSolo: {
      auto& t = track(p.integer("track_index", 0));
      const bool solo = p.boolean("solo", false);
      checkpoint();
      t.solo = solo;
      return { { "track_name", t.name }, { "solo", t.solo } };
    }
    case CommandKind::SetTrackArm: {
      auto& t = track(p.integer("track_index", 0));
      const bool arm = p.boolean("arm", false);
      checkpoint();
      t.arm = arm;
      return { { "track_name", t.name }, { "arm", t.arm } };
    }
    case CommandKind::SetDeviceParameter: {
      auto& t = track(p.integer("track_index", 0));
      auto& d = device(t, p.integer("device_index", 0));
      const auto paramIndex = p.integer("parameter_index", 0);
      if (!inRange(paramIndex, d.parameters.size()))
        throw HostError("Parameter index out of range");
      auto& param = d.parameters[static_cast<std::size_t>(paramIndex)];
      const double value = p.number("value", 0.0);
      if (value < param.min || value > param.max)
        throw HostError("Parameter value out of range");
      checkpoint();
      param.value = param.quantized ? std::round(value) : value;
      return { { "device_name", d.name },
               { "parameter_index", paramIndex },
               { "parameter_name", param.name },
               { "value", param.value } };
    }
    case CommandKind::SetSendAmount: {
      const auto trackIndex = p.integer("track_index", 0);
      auto& t = track(trackIndex);
      const auto sendIndex = p.integer("send_index", 0);
      if (!inRange(sendIndex, t.sends.size()))
        throw HostError("Send index out of range");
      const double amount = clamp(p.number("amount", 0.0), 0.0, 1.0);
      checkpoint();
      t.sends[static_cast<std::size_t>(sendIndex)] = amount;
      return { { "track_index", trackIndex }, { "send_index", sendIndex }, { "amount", amount } };
    }
    case CommandKind::SetMasterVolume: {
      const double volume = clamp(p.number("volume", 0.75), 0.0, 1.0);
      checkpoint();
      state_.masterVolume = volume;
      return { { "volume", volume } };
    }
    case CommandKind::SetClipLaunchMode: {
      auto& t = track(p.integer("track_index", 0));
      auto& c = clip(t, p.integer("clip_index", 0));
      const auto mode = p.integer("mode", 0);
      if (mode < 0 || mode > 3)
        throw HostError("Launch mode out of range");
      checkpoint();
      c.launchMode = static_cast<int>(mode);
      return { { "launch_mode", c.launchMode } };
    }
    case CommandKind::FireClip: {
      auto& t = track(p.integer("track_index", 0));
      auto& c = clip(t, p.integer("clip_index", 0));
      for (auto& s : t.slots) {
        if (s)
          s->playing = false;
      }
      c.playing = true;
      state_.playing = true;
      return { { "fired", true } };
    }

    //---queries--------------------------------------------------------
    case CommandKind::GetSessionInfo:
      return sessionInfo();
    case CommandKind::GetTrackInfo:
      return trackInfo(p.integer("track_index", 0));
    case CommandKind::GetAllTracks: {
      json tracks = json::array();
      for (std::size_t i = 0; i < state_.tracks.size(); ++i) {
        const auto& t = state_.tracks[i];
        tracks.push_back({ { "index", i },
                           { "name", t.name },
                           { "is_audio", !t.midi },
                           { "is_midi", t.midi },
                           { "mute", t.mute },
                           { "solo", t.solo },
                           { "arm", t.arm } });
      }
      const auto count = tracks.size();
      return { { "tracks", std::move(tracks) }, { "count", count } };
    }
    case CommandKind::GetDeviceParameters: {
      auto& t = track(p.integer("track_index", 0));
      const auto deviceIndex = p.integer("device_index", 0);
      const auto& d = device(t, deviceIndex);
      json parameters = json::array();
      for (std::size_t i = 0; i < d.parameters.size(); ++i) {
        const auto& param = d.parameters[i];
        parameters.push_back({ { "index", i },
                               { "name", param.name },
                               { "value", param.value },
                               { "min", param.min },
                               { "max", param.max },
                               { "is_quantized", param.quantized } });
      }
      return { { "device_name", d.name },
               { "device_index", deviceIndex },
               { "parameters", std::move(parameters) } };
    }
    case CommandKind::GetClipNotes: {
      auto& t = track(p.integer("track_index", 0));
      const auto& c = clip(t, p.integer("clip_index", 0));
      const double fromTime = p.number("from_time", 0.0);
      // pitches live in 0..127, so clamping the window keeps its meaning
      const auto fromPitch = std::clamp(p.integer("from_pitch", 0), 0LL, 128LL);
      const double timeSpan = p.number("time_span", 999999.0);
      const auto pitchSpan = std::clamp(p.integer("pitch_span", 128), 0LL, 128LL);

      json notes = json::array();
      for (const auto& n : c.notes) {
        if (n.startTime >= fromTime && n.startTime < fromTime + timeSpan &&
            n.pitch >= fromPitch && n.pitch < fromPitch + pitchSpan)
          notes.push_back(noteToJson(n));
      }
      const auto count = notes.size();
      return { { "notes", std::move(notes) }, { "count", count } };
    }
    case CommandKind::GetPlayheadPosition: {
      const int beatsPerBar = state_.signatureNumerator;
      const double bars = std::floor(state_.songTime / beatsPerBar);
      const double inBar = state_.songTime - bars * beatsPerBar;
      const double beat = std::floor(inBar);
      return { { "bars", static_cast<long long>(bars) + 1 },
               { "beats", static_cast<long long>(beat) + 1 },
               { "sub_division", static_cast<long long>(std::floor((inBar - beat) * 4.0)) + 1 },
               { "song_time", state_.songTime } };
    }

    //---structure------------------------------------------------------
    case CommandKind::CreateMidiTrack:
    case CommandKind::CreateAudioTrack: {
      const bool midi = kind == CommandKind::CreateMidiTrack;
      const auto index = p.integer("index", -1);
      if (index < -1 || index > static_cast<long long>(state_.tracks.size()))
        throw HostError("Track index out of range");
      checkpoint();
      const auto created = insertTrack(midi, index);
      return { { "index", created }, { "name", state_.tracks[static_cast<std::size_t>(created)].name } };
    }
    case CommandKind::DeleteTrack: {
      const auto index = p.integer("track_index", 0);
      const std::string name = track(index).name;
      checkpoint();
      state_.tracks.erase(state_.tracks.begin() + index);
      return { { "deleted_index", index }, { "deleted_track", name } };
    }
    case CommandKind::DeleteAllTracks: {
      const auto count = state_.tracks.size();
      checkpoint();
      state_.tracks.clear();
      return { { "deleted_count", count } };
    }
    case CommandKind::SetTrackName: {
      auto& t = track(p.integer("track_index", 0));
      auto name = p.text("name", "");
      checkpoint();
      t.name = std::move(name);
      return { { "name", t.name } };
    }
    case CommandKind::CreateClip: {
      auto& t = track(p.integer("track_index", 0));
      auto& s = slot(t, p.integer("clip_index", 0));
      const double length = p.number("length", 4.0);
      if (!t.midi)
        throw HostError("Cannot create a MIDI clip on an audio track");
      if (s)
        throw HostError("Clip slot already has a clip");
      if (length <= 0.0)
        throw HostError("Clip length must be positive");
      checkpoint();
      s = Clip{};
      s->length = length;
      return { { "name", s->name }, { "length", s->length } };
    }
    case CommandKind::DeleteClip: {
      const auto trackIndex = p.integer("track_index", 0);
      const auto clipIndex = p.integer("clip_index", 0);
      auto& t = track(trackIndex);
      clip(t, clipIndex);
      checkpoint();
      slot(t, clipIndex).reset();
      return { { "deleted", true }, { "track_index", trackIndex }, { "clip_index", clipIndex } };
    }
    case CommandKind::AddNotesToClip: {
      auto& t = track(p.integer("track_index", 0));
      auto& c = clip(t, p.integer("clip_index", 0));
      const auto raw = p.array("notes");
      std::vector<Note> parsed;
      parsed.reserve(raw.size());
      for (const auto& n : raw)
        parsed.push_back(parseNote(n));
      checkpoint();
      c.notes.insert(c.notes.end(), parsed.begin(), parsed.end());
      return { { "note_count", parsed.size() } };
    }
    case CommandKind::SetClipName: {
      auto& t = track(p.integer("track_index", 0));
      auto& c = clip(t, p.integer("clip_index", 0));
      auto name = p.text("name", "");
      checkpoint();
      c.name = std::move(name);
      return { { "name", c.name } };
    }
    case CommandKind::StopClip: {
      auto& t = track(p.integer("track_index", 0));
      auto& s = slot(t, p.integer("clip_index", 0));
      if (s)
        s->playing = false;
      return { { "stopped", true } };
    }
    case CommandKind::SetTempo: {
      const double tempo = p.number("tempo", 120.0);
      if (tempo < 20.0 || tempo > 999.0)
        throw HostError("Tempo out of range");
      checkpoint();
      state_.tempo = tempo;
      return { { "tempo", state_.tempo } };
    }
    case CommandKind::StartPlayback:
      state_.playing = true;
      return { { "playing", state_.playing } };
    case CommandKind::StopPlayback:
      state_.playing = false;
      for (auto& t : state_.tracks) {
        for (auto& s : t.slots) {
          if (s)
            s->playing = false;
        }
      }
      return { { "playing", state_.playing } };
    case CommandKind::ToggleDeviceBypass: {
      const auto trackIndex = p.integer("track_index", 0);
      const auto deviceIndex = p.integer("device_index", 0);
      auto& d = device(track(trackIndex), deviceIndex);
      const bool enabled = p.boolean("enabled", true);
      auto it = std::find_if(d.parameters.begin(), d.parameters.end(),
                             [](const DeviceParameter& dp) { return dp.name == "Device On"; });
      if (it == d.parameters.end())
        throw HostError("Device has no bypass parameter");
      checkpoint();
      it->value = enabled ? 1.0 : 0.0;
      return { { "track_index", trackIndex },
               { "device_index", deviceIndex },
               { "device_name", d.name },
               { "bypass_enabled", it->value } };
    }
    case CommandKind::CreateScene: {
      const auto index = p.integer("index", -1);
      if (index < -1 || index > static_cast<long long>(state_.scenes.size()))
        throw HostError("Scene index out of range");
      checkpoint();
      const auto at = index == -1 ? state_.scenes.size() : static_cast<std::size_t>(index);
      state_.scenes.insert(state_.scenes.begin() + static_cast<long>(at), std::string{});
      for (auto& t : state_.tracks)
        t.slots.insert(t.slots.begin() + static_cast<long>(at), std::nullopt);
      return { { "scene_index", at } };
    }
    case CommandKind::DeleteScene: {
      const auto index = p.integer("scene_index", 0);
      if (!inRange(index, state_.scenes.size()))
        throw HostError("Scene index out of range");
      if (state_.scenes.size() == 1)
        throw HostError("Cannot delete the last scene");
      checkpoint();
      state_.scenes.erase(state_.scenes.begin() + index);
      for (auto& t : state_.tracks)
        t.slots.erase(t.slots.begin() + index);
      return { { "deleted_scene_index", index } };
    }
    case CommandKind::FireScene: {
      const auto index = p.integer("scene_index", 0);
      if (!inRange(index, state_.scenes.size()))
        throw HostError("Scene index out of range");
      for (auto& t : state_.tracks) {
        auto& target = t.slots[static_cast<std::size_t>(index)];
        if (!target)
          continue;
        for (auto& s : t.slots) {
          if (s)
            s->playing = false;
        }
        target->playing = true;
      }
      state_.playing = true;
      return { { "fired_scene_index", index } };
    }
    case CommandKind::SetPlayheadPosition: {
      const auto bar = p.integer("bar", 1);
      const double beat = p.number("beat", 0.0);
      if (bar < 1)
        throw HostError("Bar must be 1 or greater");
      if (bar > kMaxBar)
        throw HostError("Bar out of range");
      if (beat < 0.0 || beat >= state_.signatureNumerator)
        throw HostError("Beat out of range");
      state_.songTime = static_cast<double>(bar - 1) * state_.signatureNumerator + beat;
      return { { "bar", bar }, { "beat", beat } };
    }
    case CommandKind::CreateLocator: {
      const auto bar = p.integer("bar", 1);
      auto name = p.text("name", "");
      if (bar < 1)
        throw HostError("Bar must be 1 or greater");
      if (bar > kMaxBar)
        throw HostError("Bar out of range");
      checkpoint();
      state_.locators.push_back(Locator{ name, static_cast<int>(bar) });
      std::stable_sort(state_.locators.begin(), state_.locators.end(),
                       [](const Locator& a, const Locator& b) { return a.bar < b.bar; });
      return { { "created", true }, { "bar", bar }, { "name", name } };
    }
    case CommandKind::DeleteLocator: {
      const auto index = p.integer("locator_index", 0);
      if (!inRange(index, state_.locators.size()))
        throw HostError("Locator index out of range");
      checkpoint();
      state_.locators.erase(state_.locators.begin() + index);
      return { { "deleted_locator_index", index } };
    }
    case CommandKind::SetLoop: {
      const auto startBar = p.integer("start_bar", 1);
      const auto endBar = p.integer("end_bar", 17);
      const bool enabled = p.boolean("enabled", true);
      if (startBar < 1)
        throw HostError("Loop start must be 1 or greater");
      if (endBar <= startBar)
        throw HostError("Loop end must be after loop start");
      if (endBar > kMaxBar)
        throw HostError("Loop end out of range");
      checkpoint();
      state_.loopStartBar = static_cast<int>(startBar);
      state_.loopEndBar = static_cast<int>(endBar);
      state_.loopEnabled = enabled;
      return { { "start_bar", startBar }, { "end_bar", endBar }, { "enabled", enabled } };
    }

    //---history--------------------------------------------------------
    case CommandKind::Undo:
    case CommandKind::Redo: {
      const bool isUndo = kind == CommandKind::Undo;
      auto& from = isUndo ? undo_ : redo_;
      if (from.empty())
        throw HostError(isUndo ? "Nothing to undo" : "Nothing to redo");

      SessionState restored = std::move(from.back());
      from.pop_back();
      // transport is not part of the edit history
      restored.playing = state_.playing;
      restored.songTime = state_.songTime;
      if (isUndo)
        redo_.push_back(std::move(state_));
      else
        undo_.push_back(std::move(state_));
      state_ = std::move(restored);
      return isUndo ? json{ { "undone", true } } : json{ { "redone", true } };
    }

    case CommandKind::Count:
      break;
  }
  throw HostError("Unsupported command: " + std::string(core::toString(kind)));
}

void SessionModel::checkpoint() {
  undo_.push_back(state_);
  if (undo_.size() > kUndoLimit)
    undo_.pop_front();
  redo_.clear();
}

Track& SessionModel::track(long long index) {
  if (!inRange(index, state_.tracks.size()))
    throw HostError("Track index out of range");
  return state_.tracks[static_cast<std::size_t>(index)];
}

Device& SessionModel::device(Track& t, long long index) {
  if (!inRange(index, t.devices.size()))
    throw HostError("Device index out of range");
  return t.devices[static_cast<std::size_t>(index)];
}

std::optional<Clip>& SessionModel::slot(Track& t, long long index) {
  if (!inRange(index, t.slots.size()))
    throw HostError("Clip index out of range");
  return t.slots[static_cast<std::size_t>(index)];
}

Clip& SessionModel::clip(Track& t, long long index) {
  auto& s = slot(t, index);
  if (!s)
    throw HostError("No clip in slot");
  return *s;
}

Track SessionModel::makeTrack(bool midi, std::size_t position) const {
  Track t;
  t.midi = midi;
  t.name = std::to_string(position + 1) + (midi ? "-MIDI" : "-Audio");
  t.sends.assign(state_.returnTracks.size(), 0.0);
  t.slots.assign(state_.scenes.size(), std::nullopt);
  if (midi)
    t.devices.push_back(makeInstrument());
  return t;
}

long long SessionModel::insertTrack(bool midi, long long index) {
  const auto at = index == -1 ? state_.tracks.size() : static_cast<std::size_t>(index);
  state_.tracks.insert(state_.tracks.begin() + static_cast<long>(at), makeTrack(midi, at));
  return static_cast<long long>(at);
}

json SessionModel::sessionInfo() const {
  return { { "tempo", state_.tempo },
           { "signature_numerator", state_.signatureNumerator },
           { "signature_denominator", state_.signatureDenominator },
           { "track_count", state_.tracks.size() },
           { "return_track_count", state_.returnTracks.size() },
           { "scene_count", state_.scenes.size() },
           { "is_playing", state_.playing },
           { "loop", { { "start_bar", state_.loopStartBar },
                       { "end_bar", state_.loopEndBar },
                       { "enabled", state_.loopEnabled } } },
           { "master_track",
             { { "name", "Master" },
               { "volume", state_.masterVolume },
               { "panning", state_.masterPan } } } };
}

json SessionModel::trackInfo(long long index) {
  const auto& t = track(index);

  json clipSlots = json::array();
  for (std::size_t i = 0; i < t.slots.size(); ++i) {
    const auto& s = t.slots[i];
    json clipInfo = nullptr;
    if (s) {
      clipInfo = { { "name", s->name },
                   { "length", s->length },
                   { "is_playing", s->playing },
                   { "is_recording", false } };
    }
    clipSlots.push_back({ { "index", i }, { "has_clip", s.has_value() }, { "clip", clipInfo } });
  }

  json devices = json::array();
  for (std::size_t i = 0; i < t.devices.size(); ++i) {
    const auto& d = t.devices[i];
    devices.push_back(
        { { "index", i }, { "name", d.name }, { "class_name", d.className }, { "type", d.type } });
  }

  return { { "index", index },
           { "name", t.name },
           { "is_audio_track", !t.midi },
           { "is_midi_track", t.midi },
           { "mute", t.mute },
           { "solo", t.solo },
           { "arm", t.arm },
           { "volume", t.volume },
           { "panning", t.pan },
           { "sends", t.sends },
           { "clip_slots", std::move(clipSlots) },
           { "devices", std::move(devices) } };
}
