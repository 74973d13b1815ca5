#pragma once
/** @file  CommandClassifier.hpp
 *  @brief Static transport / criticality policy per catalog command.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// cuebridge headers
#include "core/CommandKind.hpp"
#include "protocols/Transport.hpp"

namespace cuebridge {
  namespace core {

    enum class Criticality : std::uint8_t { Critical, Reversible };

    inline std::string_view toString(Criticality c) {
      return c == Criticality::Critical ? "Critical" : "Reversible";
    }

    /// Bit set over protocols::Transport.
    enum TransportMask : std::uint8_t {
      kTcpOnly = 1u << 0,
      kUdpOnly = 1u << 1,
      kTcpAndUdp = kTcpOnly | kUdpOnly,
    };

    struct ClassificationEntry {
      CommandKind kind;
      std::string_view commandName;
      std::uint8_t allowedTransports;
      Criticality criticality;

      bool allows(protocols::Transport t) const noexcept {
        const auto bit = t == protocols::Transport::Tcp ? kTcpOnly : kUdpOnly;
        return (allowedTransports & bit) != 0;
      }
    };

    /**
 * @class CommandClassifier
 * @brief Pure lookup from a wire name to its ClassificationEntry.
 *
 *  * UDP-eligible entries are reversible, return nothing the caller needs,
 *    carry a small payload and are sent at control-loop rates.
 *  * Everything else is TCP-only / Critical.
 *  * Names outside the catalog yield std::nullopt; they are never
 *    upgraded to UDP eligibility.
 */
    class CommandClassifier {
    public:
      CommandClassifier();

      std::optional<ClassificationEntry> classify(std::string_view commandName) const;
      const ClassificationEntry& entryFor(CommandKind kind) const;

      const std::array<ClassificationEntry, kCommandKindCount>& table() const noexcept {
        return table_;
      }

    private:
      std::array<ClassificationEntry, kCommandKindCount> table_;
    };

  } // namespace core
} // namespace cuebridge
