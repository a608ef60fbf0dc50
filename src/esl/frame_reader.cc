#include "fsesl/esl/frame_reader.h"

#include <limits>

#include "fsesl/esl/text_utils.h"

namespace fsesl {
namespace esl {

namespace {

bool isBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

}  // namespace

Result<std::string> FrameReader::readHeaders() {
  std::string block;
  std::string line;
  for (;;) {
    line.clear();
    auto result = reader_.readLine(line);
    if (!result.ok()) {
      return makeError<std::string>(
          errors::TRANSPORT_ERROR,
          "Error reading headers: " + result.error_info->message);
    }
    if (isBlank(line)) {
      break;
    }
    block += line;
  }
  return block;
}

Result<std::string> FrameReader::readBody(size_t length) {
  std::string body;
  auto result = reader_.readExact(length, body);
  if (!result.ok()) {
    // The peer promised more than it sent: the stream is out of step
    int code = result.error_code() == network::STREAM_EOF
                   ? errors::MALFORMED_FRAME
                   : errors::TRANSPORT_ERROR;
    return makeError<std::string>(
        code, "Error reading message body after " +
                  std::to_string(body.size()) + " of " +
                  std::to_string(length) +
                  " bytes: " + result.error_info->message);
  }
  return body;
}

Result<Frame> FrameReader::readFrame() {
  auto headers = readHeaders();
  if (holds_alternative<Error>(headers)) {
    return get<Error>(headers);
  }

  Frame frame;
  frame.raw_headers = std::move(get<std::string>(headers));
  frame.headers = Frame::parseHeaderBlock(frame.raw_headers);

  if (!frame.hasHeader(headers::CONTENT_LENGTH)) {
    return frame;
  }

  auto length = parseContentLength(frame.header(headers::CONTENT_LENGTH));
  if (holds_alternative<Error>(length)) {
    return get<Error>(length);
  }

  auto body = readBody(get<size_t>(length));
  if (holds_alternative<Error>(body)) {
    return get<Error>(body);
  }
  frame.body = std::move(get<std::string>(body));
  frame.has_body = true;
  return frame;
}

Result<size_t> FrameReader::parseContentLength(const std::string& value) {
  std::string digits = trim(value);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos) {
    return makeError<size_t>(errors::MALFORMED_FRAME,
                             "Cannot extract content length from '" + value +
                                 "'");
  }

  size_t length = 0;
  for (char c : digits) {
    size_t digit = static_cast<size_t>(c - '0');
    if (length > (std::numeric_limits<size_t>::max() - digit) / 10) {
      return makeError<size_t>(errors::MALFORMED_FRAME,
                               "Content length out of range: " + digits);
    }
    length = length * 10 + digit;
  }
  return length;
}

}  // namespace esl
}  // namespace fsesl
