#ifndef FSESL_ESL_FRAME_H
#define FSESL_ESL_FRAME_H

#include <string>
#include <utility>
#include <vector>

namespace fsesl {
namespace esl {

// Content-Type values that steer the demultiplexer
namespace content_types {
constexpr char AUTH_REQUEST[] = "auth/request";
constexpr char API_RESPONSE[] = "api/response";
constexpr char COMMAND_REPLY[] = "command/reply";
constexpr char EVENT_PLAIN[] = "text/event-plain";
constexpr char DISCONNECT_NOTICE[] = "text/disconnect-notice";
}  // namespace content_types

namespace headers {
constexpr char CONTENT_TYPE[] = "Content-Type";
constexpr char CONTENT_LENGTH[] = "Content-Length";
constexpr char REPLY_TEXT[] = "Reply-Text";
constexpr char EVENT_NAME[] = "Event-Name";
}  // namespace headers

constexpr char REPLY_OK[] = "+OK";
constexpr char REPLY_ERR[] = "-ERR";

using Header = std::pair<std::string, std::string>;

/**
 * One protocol message: a header block and an optional body.
 *
 * `has_body` is true exactly when the header block declared a
 * Content-Length; `body` then holds that many bytes verbatim.
 */
struct Frame {
  std::string raw_headers;  // header lines as read, blank terminator excluded
  std::vector<Header> headers;
  std::string body;
  bool has_body{false};

  // First value for `name`, or empty
  std::string header(const std::string& name) const;
  bool hasHeader(const std::string& name) const;

  std::string contentType() const { return header(headers::CONTENT_TYPE); }
  std::string replyText() const { return header(headers::REPLY_TEXT); }

  // Split "Name: Value" lines; lines without a colon are kept only in raw
  static std::vector<Header> parseHeaderBlock(const std::string& raw);
};

inline bool startsWith(const std::string& str, const char* prefix) {
  return str.rfind(prefix, 0) == 0;
}

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_FRAME_H
