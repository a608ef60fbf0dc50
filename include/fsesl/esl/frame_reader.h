#ifndef FSESL_ESL_FRAME_READER_H
#define FSESL_ESL_FRAME_READER_H

#include <string>

#include "fsesl/core/result.h"
#include "fsesl/esl/frame.h"
#include "fsesl/network/buffered_reader.h"

namespace fsesl {
namespace esl {

/**
 * Reads frames off a buffered stream.
 *
 * A frame is a block of header lines ended by a whitespace-only line,
 * optionally followed by exactly Content-Length bytes of body. The reader
 * is stateless apart from the stream; teardown on failure belongs to the
 * owner of the stream.
 */
class FrameReader {
 public:
  explicit FrameReader(network::BufferedReader& reader) : reader_(reader) {}

  // Header lines up to the blank terminator, newlines kept
  Result<std::string> readHeaders();

  Result<std::string> readBody(size_t length);

  Result<Frame> readFrame();

  // Non-negative decimal value or MALFORMED_FRAME
  static Result<size_t> parseContentLength(const std::string& value);

 private:
  network::BufferedReader& reader_;
};

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_FRAME_READER_H
