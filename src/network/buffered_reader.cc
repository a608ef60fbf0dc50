#include "fsesl/network/buffered_reader.h"

#include <algorithm>
#include <cstring>

namespace fsesl {
namespace network {

BufferedReader::BufferedReader(ByteStreamPtr stream, size_t buffer_size)
    : stream_(std::move(stream)), buffer_(std::max<size_t>(buffer_size, 16)) {}

IoVoidResult BufferedReader::fill() {
  if (start_ == end_) {
    start_ = end_ = 0;
  } else if (start_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + start_, end_ - start_);
    end_ -= start_;
    start_ = 0;
  }

  auto result = stream_->read(buffer_.data() + end_, buffer_.size() - end_);
  if (!result.ok()) {
    return IoVoidResult::error(result.error_code(),
                               result.error_info->message);
  }
  if (*result == 0) {
    return IoVoidResult::error(STREAM_EOF, "Connection closed by peer");
  }
  end_ += *result;
  return IoVoidResult::success();
}

IoVoidResult BufferedReader::readLine(std::string& line) {
  for (;;) {
    const char* begin = buffer_.data() + start_;
    const char* stop = buffer_.data() + end_;
    const char* nl = std::find(begin, stop, '\n');
    if (nl != stop) {
      line.append(begin, nl + 1);
      start_ += static_cast<size_t>(nl + 1 - begin);
      return IoVoidResult::success();
    }

    // No newline yet: keep what we have and read more
    line.append(begin, stop);
    start_ = end_;
    auto filled = fill();
    if (!filled.ok()) {
      return filled;
    }
  }
}

IoVoidResult BufferedReader::readExact(size_t len, std::string& out) {
  // Declared lengths come off the wire; grow as bytes actually arrive
  out.reserve(out.size() + std::min<size_t>(len, buffer_.size()));
  while (len > 0) {
    if (start_ == end_) {
      auto filled = fill();
      if (!filled.ok()) {
        return filled;
      }
    }
    size_t chunk = std::min(len, end_ - start_);
    out.append(buffer_.data() + start_, chunk);
    start_ += chunk;
    len -= chunk;
  }
  return IoVoidResult::success();
}

}  // namespace network
}  // namespace fsesl
