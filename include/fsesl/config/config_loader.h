/**
 * @file config_loader.h
 * @brief File-based client configuration
 *
 * Search order, first existing file wins:
 *   1. Explicit path (--config)
 *   2. FSESL_CONFIG environment variable
 *   3. ./config/fsesl.yaml
 *   4. ./fsesl.yaml
 *   5. /etc/fsesl/fsesl.yaml
 *
 * Files are YAML; JSON documents parse as YAML too. ${VAR} and
 * ${VAR:-default} references are expanded from the environment before
 * parsing.
 */

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "fsesl/config/config_types.h"
#include "fsesl/config/parse_error.h"
#include "fsesl/logging/log_sink.h"

namespace fsesl {
namespace config {

class ConfigLoader {
 public:
  explicit ConfigLoader(std::string explicit_path = "")
      : explicit_path_(std::move(explicit_path)) {}

  // Empty when no candidate exists
  std::string findConfigFile() const;

  std::vector<std::string> searchPaths() const;

  /**
   * Load the first file found, or defaults when there is none. Throws
   * ConfigParseError on malformed content or an explicit path that does
   * not exist.
   */
  ClientConfig load() const;

  static ClientConfig loadFile(const std::string& path);
  static ClientConfig parse(const std::string& content,
                            const std::string& source = "");

  static std::string substituteEnvironmentVariables(
      const std::string& content, const std::string& source = "");

  // Sink described by `settings`; throws ConfigParseError for a file sink
  // without a file name
  static std::shared_ptr<logging::LogSink> createSink(
      const LoggingConfig& settings);

  // Install level and sink as registry defaults
  static void applyLogging(const LoggingConfig& settings);

 private:
  std::string explicit_path_;
};

}  // namespace config
}  // namespace fsesl
