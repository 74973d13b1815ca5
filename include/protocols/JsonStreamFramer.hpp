#pragma once
/** @file  JsonStreamFramer.hpp
 *  @brief Splits a TCP byte stream into whole top-level JSON objects.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cuebridge {
  namespace protocols {

    /// One unit handed to the connection: a complete object, or junk to report.
    struct Frame {
      enum class Kind { Object, Invalid };

      Kind kind;
      std::string text; ///< object text, or the reason for Invalid

      bool valid() const noexcept { return kind == Kind::Object; }
    };

    /**
 * @class JsonStreamFramer
 * @brief Incremental bracket-matching scanner over an accumulating buffer.
 *
 *  * A frame ends where the object opened with `{` is closed again. `{` and
 *    `[` share one stack and every closer must match the innermost opener;
 *    brackets inside strings (and escaped quotes) are ignored.
 *  * Whitespace between messages is skipped, so back-to-back objects and
 *    newline-delimited JSON both frame correctly.
 *  * Every message that is not an object yields exactly one Invalid frame
 *    and nothing inside it is ever framed: a top-level array is skipped by
 *    bracket depth, anything else through the next newline.
 *  * A mismatched closer invalidates the object; the rest of it is skipped
 *    until its brackets balance or the line ends.
 *  * An object growing past `maxFrameBytes` is discarded while its depth
 *    is still tracked; one Invalid frame is reported when it closes.
 *  * Scanning resumes where it stopped: O(1) work per fed byte.
 */
    class JsonStreamFramer {
    public:
      explicit JsonStreamFramer(std::size_t maxFrameBytes = 1024 * 1024);

      void feed(std::string_view bytes);

      /// Next complete frame, or std::nullopt until more bytes arrive.
      std::optional<Frame> next();

      std::size_t buffered() const noexcept { return buffer_.size(); }
      void reset();

    private:
      enum class Mode { Between, Object, Skip };

      bool skipRest(); ///< @returns true once the skipped message has ended
      void endMessage();

      std::size_t maxFrameBytes_;
      std::string buffer_;
      std::size_t scan_{ 0 }; ///< bytes of buffer_ already scanned
      Mode mode_{ Mode::Between };
      std::string open_;      ///< unclosed `{` / `[` of the current message
      bool inString_{ false };
      bool escape_{ false };
      bool oversized_{ false };     ///< object past the cap: bytes dropped, depth tracked
      bool skipByDepth_{ false };   ///< skipped message ends when open_ empties
      bool skipToNewline_{ false }; ///< skipped message ends at the next newline
    };

  } // namespace protocols
} // namespace cuebridge
