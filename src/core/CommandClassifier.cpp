/* @file CommandClassifier.cpp
 * @brief compiled-in classification policy
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// cuebridge headers
#include "core/CommandClassifier.hpp"

using namespace cuebridge::core;

namespace {
  bool isUdpEligible(CommandKind kind) {
    switch (kind) {
    case CommandKind::SetTrackVolume:
    case CommandKind::SetTrackPan:
    case CommandKind::SetTrackMute:
    case CommandKind::SetTrackSolo:
    case CommandKind::SetTrackArm:
    case CommandKind::SetDeviceParameter:
    case CommandKind::SetSendAmount:
    case CommandKind::SetMasterVolume:
    case CommandKind::SetClipLaunchMode:
    case CommandKind::FireClip:
      return true;
    case CommandKind::GetSessionInfo:
    case CommandKind::GetTrackInfo:
    case CommandKind::GetAllTracks:
    case CommandKind::GetDeviceParameters:
    case CommandKind::GetClipNotes:
    case CommandKind::GetPlayheadPosition:
    case CommandKind::CreateMidiTrack:
    case CommandKind::CreateAudioTrack:
    case CommandKind::DeleteTrack:
    case CommandKind::DeleteAllTracks:
    case CommandKind::SetTrackName:
    case CommandKind::CreateClip:
    case CommandKind::DeleteClip:
    case CommandKind::AddNotesToClip:
    case CommandKind::SetClipName:
    case CommandKind::StopClip:
    case CommandKind::SetTempo:
    case CommandKind::StartPlayback:
    case CommandKind::StopPlayback:
    case CommandKind::ToggleDeviceBypass:
    case CommandKind::CreateScene:
    case CommandKind::DeleteScene:
    case CommandKind::FireScene:
    case CommandKind::SetPlayheadPosition:
    case CommandKind::CreateLocator:
    case CommandKind::DeleteLocator:
    case CommandKind::SetLoop:
    case CommandKind::Undo:
    case CommandKind::Redo:
    case CommandKind::Count:
      return false;
    }
    return false;
  }
} // namespace

CommandClassifier::CommandClassifier() {
  for (auto kind : allCommandKinds()) {
    const bool udp = isUdpEligible(kind);
    table_[static_cast<std::size_t>(kind)] =
        ClassificationEntry{ kind, toString(kind), udp ? kTcpAndUdp : kTcpOnly,
                             udp ? Criticality::Reversible : Criticality::Critical };
  }
}

std::optional<ClassificationEntry> CommandClassifier::classify(std::string_view commandName) const {
  auto kind = commandKindFromString(commandName);
  if (!kind)
    return std::nullopt;
  return table_[static_cast<std::size_t>(*kind)];
}

const ClassificationEntry& CommandClassifier::entryFor(CommandKind kind) const {
  const auto index = static_cast<std::size_t>(kind);
  if (index >= table_.size())
    throw std::out_of_range("[CommandClassifier] kind outside the catalog");
  return table_[index];
}
