#ifndef FSESL_ESL_TEXT_UTILS_H
#define FSESL_ESL_TEXT_UTILS_H

#include <map>
#include <string>
#include <vector>

namespace fsesl {
namespace esl {

// Offsets of every non-overlapping occurrence of `searched` in `str`
std::vector<size_t> indexStringAll(const std::string& str,
                                   const std::string& searched);

/**
 * Split on `sep`, except where the separator sits inside {...} or [...].
 * When the brackets in `str` are unbalanced, groups are not honoured and the
 * string is split on every separator.
 */
std::vector<std::string> splitIgnoreGroups(const std::string& str,
                                           const std::string& sep);

// Value of the first "name: value" line, trimmed; empty when absent
std::string headerValue(const std::string& header_block,
                        const std::string& name);

// Query-style percent decoding ('+' is a space); `value` on malformed input
std::string urlDecode(const std::string& value);

/**
 * Event body to header map, values url-decoded. Headers listed in
 * `excluded` are left out.
 */
std::map<std::string, std::string> eventStrToMap(
    const std::string& event,
    const std::vector<std::string>& excluded = {});

/**
 * Rows of a tabular listing such as "show channels": a CSV header line,
 * data lines, then a blank line, a "N total." line and a trailing blank.
 * Rows whose column count does not match the header are skipped.
 */
std::vector<std::map<std::string, std::string>> mapChanData(
    const std::string& listing);

std::string trim(const std::string& str);

}  // namespace esl
}  // namespace fsesl

#endif  // FSESL_ESL_TEXT_UTILS_H
