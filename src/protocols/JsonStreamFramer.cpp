/* @file JsonStreamFramer.cpp
 * @brief resumable object framing for the TCP read path
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>

// cuebridge headers
#include "protocols/JsonStreamFramer.hpp"

using namespace cuebridge::protocols;

namespace {
  constexpr std::size_t kMaxNesting = 256;

  bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

  char openerFor(char closer) { return closer == '}' ? '{' : '['; }
} // namespace

JsonStreamFramer::JsonStreamFramer(std::size_t maxFrameBytes)
    : maxFrameBytes_(maxFrameBytes < 2 ? 2 : maxFrameBytes) {}

void JsonStreamFramer::feed(std::string_view bytes) { buffer_.append(bytes.data(), bytes.size()); }

void JsonStreamFramer::reset() {
  buffer_.clear();
  scan_ = 0;
  endMessage();
}

void JsonStreamFramer::endMessage() {
  mode_ = Mode::Between;
  open_.clear();
  inString_ = false;
  escape_ = false;
  oversized_ = false;
  skipByDepth_ = false;
  skipToNewline_ = false;
}

std::optional<Frame> JsonStreamFramer::next() {
  for (;;) {
    if (mode_ == Mode::Skip) {
      if (!skipRest())
        return std::nullopt;
      endMessage();
    }

    if (mode_ == Mode::Between) {
      std::size_t start = 0;
      while (start < buffer_.size() && isSpace(buffer_[start]))
        ++start;
      buffer_.erase(0, start);
      scan_ = 0;
      if (buffer_.empty())
        return std::nullopt;
      if (buffer_.front() != '{') {
        // the whole message is reported here; skipRest() only eats its bytes
        mode_ = Mode::Skip;
        skipByDepth_ = buffer_.front() == '[';
        skipToNewline_ = !skipByDepth_;
        return Frame{ Frame::Kind::Invalid, "Message must be a JSON object" };
      }
      mode_ = Mode::Object;
    }

    while (scan_ < buffer_.size()) {
      const char c = buffer_[scan_++];
      if (inString_) {
        if (escape_)
          escape_ = false;
        else if (c == '\\')
          escape_ = true;
        else if (c == '"')
          inString_ = false;
      } else if (c == '"') {
        inString_ = true;
      } else if (c == '{' || c == '[') {
        open_.push_back(c);
        if (open_.size() > kMaxNesting) {
          buffer_.erase(0, scan_);
          scan_ = 0;
          mode_ = Mode::Skip;
          open_.clear();
          skipToNewline_ = true;
          return Frame{ Frame::Kind::Invalid, "Message nests too deeply" };
        }
      } else if (c == '}' || c == ']') {
        if (open_.back() != openerFor(c)) {
          const bool wasOversized = oversized_;
          buffer_.erase(0, scan_);
          scan_ = 0;
          mode_ = Mode::Skip;
          skipByDepth_ = true;
          skipToNewline_ = true;
          return Frame{ Frame::Kind::Invalid, wasOversized ? "Message exceeds maximum size"
                                                           : "Mismatched bracket in message" };
        }
        open_.pop_back();
        if (open_.empty()) {
          std::optional<Frame> frame;
          if (oversized_)
            frame = Frame{ Frame::Kind::Invalid, "Message exceeds maximum size" };
          else
            frame = Frame{ Frame::Kind::Object, buffer_.substr(0, scan_) };
          buffer_.erase(0, scan_);
          scan_ = 0;
          endMessage();
          return frame;
        }
      }

      if (!oversized_ && scan_ > maxFrameBytes_)
        oversized_ = true;
      if (oversized_ && scan_ == buffer_.size()) {
        buffer_.clear(); // keep the scanner state, drop the bytes
        scan_ = 0;
      }
    }
    return std::nullopt; // object still open, wait for more bytes
  }
}

bool JsonStreamFramer::skipRest() {
  std::size_t i = 0;
  bool ended = false;
  while (i < buffer_.size() && !ended) {
    const char c = buffer_[i++];
    if (skipToNewline_ && c == '\n') {
      ended = true;
    } else if (!skipByDepth_) {
      continue;
    } else if (inString_) {
      if (escape_)
        escape_ = false;
      else if (c == '\\')
        escape_ = true;
      else if (c == '"')
        inString_ = false;
    } else if (c == '"') {
      inString_ = true;
    } else if (c == '{' || c == '[') {
      open_.push_back(c);
      if (open_.size() > kMaxNesting) {
        open_.clear();
        skipByDepth_ = false;
        skipToNewline_ = true;
      }
    } else if ((c == '}' || c == ']') && !open_.empty() && open_.back() == openerFor(c)) {
      open_.pop_back();
      ended = open_.empty();
    }
  }
  buffer_.erase(0, i);
  scan_ = 0;
  return ended;
}
