#include "fsesl/esl/frame.h"

#include "fsesl/esl/text_utils.h"

namespace fsesl {
namespace esl {

std::string Frame::header(const std::string& name) const {
  for (const auto& h : headers) {
    if (h.first == name) {
      return h.second;
    }
  }
  return std::string();
}

bool Frame::hasHeader(const std::string& name) const {
  for (const auto& h : headers) {
    if (h.first == name) {
      return true;
    }
  }
  return false;
}

std::vector<Header> Frame::parseHeaderBlock(const std::string& raw) {
  std::vector<Header> result;
  size_t pos = 0;
  while (pos < raw.size()) {
    size_t eol = raw.find('\n', pos);
    if (eol == std::string::npos) {
      eol = raw.size();
    }
    std::string line = raw.substr(pos, eol - pos);
    pos = eol + 1;

    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    result.emplace_back(trim(line.substr(0, colon)),
                        trim(line.substr(colon + 1)));
  }
  return result;
}

}  // namespace esl
}  // namespace fsesl
