#pragma once

/**
 * @page sh-framer serialhub Line Framer
 * @file framer.hpp
 * @brief Newline framing for the text stream coming off the serial device.
 *
 * @details
 * OVERVIEW
 * --------
 * Serial devices talk in lines: a firmware prints "OK\n", "T=21.5\r\n" and so on.
 * The tty hands those bytes over in arbitrary slices (one byte, half a line, three
 * lines at once). The framer glues the slices back together and cuts one message
 * per delimiter, so the rest of the relay only ever sees whole lines.
 *
 * FRAMING RULES
 * -------------
 * - Delimiter is LF (0x0A). Bytes before the first delimiter stay buffered across
 *   feed() calls for as long as it takes.
 * - Each emitted line is trimmed of leading and trailing ASCII whitespace, so
 *   CRLF firmware needs no special casing. Lines that trim to nothing are skipped.
 * - The delimiter is never part of an emitted message.
 *
 * UTF-8 HANDLING
 * --------------
 * - Every chunk is validated before it touches the line buffer. A chunk with an
 *   invalid sequence is dropped whole and reported as FeedResult::InvalidUtf8;
 *   the partial line collected so far survives untouched.
 * - A multi-byte sequence cut in half by the chunk boundary is not an error. The
 *   truncated tail is carried and judged together with the next chunk. This keeps
 *   framing independent of how the bytes were sliced for any valid stream.
 *
 * KNOWN LIMITS
 * ------------
 * - No line-length bound. A device that never sends LF grows the buffer without
 *   limit; buffered() exposes the size for callers that want to watch it.
 *
 * EXAMPLE
 * -------
 * @code
 *   serialhub::LineFramer framer;
 *   std::vector<std::string> lines;
 *   framer.feed("O", lines);     // nothing yet, "O" is buffered
 *   framer.feed("K\r\n", lines); // lines == {"OK"}
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace serialhub {

/**
 * @brief Scan @p data for UTF-8 validity, tolerating a truncated final sequence.
 *
 * @param data      Bytes to check.
 * @param complete  On success, length of the prefix made of whole code points.
 *                  Anything after it is the start of a sequence that ran off the end.
 * @return false as soon as a byte sequence is impossible in UTF-8 (bad lead byte,
 *         bad continuation, overlong form, surrogate, or beyond U+10FFFF).
 */
bool scan_utf8(const std::string& data, std::size_t& complete);

class LineFramer {
public:
  enum class FeedResult : uint8_t { Ok = 0, InvalidUtf8 = 1 };

  static constexpr char DELIMITER = '\n';

  /// Append one chunk and push every completed line onto @p out (in order).
  FeedResult feed(const uint8_t* data, std::size_t len, std::vector<std::string>& out);
  FeedResult feed(const std::string& chunk, std::vector<std::string>& out);

  /// Bytes held back waiting for a delimiter (partial line plus carried UTF-8 tail).
  std::size_t buffered() const { return line_.size() + carry_.size(); }

  void reset();

private:
  std::string line_;   ///< validated bytes of the line in progress
  std::string carry_;  ///< truncated UTF-8 sequence from the end of the last chunk
};

} // namespace serialhub
