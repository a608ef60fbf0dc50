#define FSESL_LOG_COMPONENT "config.loader"

#include "fsesl/config/config_loader.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <sys/stat.h>

#include <yaml-cpp/yaml.h>

#include "fsesl/logging/log_formatter.h"
#include "fsesl/logging/logger_registry.h"

#include "fsesl/logging/log_macros.h"

namespace fsesl {
namespace config {

namespace {

const char* const kKnownKeys[] = {
    "address", "password", "reconnects", "backoff_ms", "read_events",
    "max_connections", "events", "filters", "logging"};

bool fileExists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

int lineOf(const YAML::Node& node) {
  return node.Mark().line >= 0 ? node.Mark().line + 1 : -1;
}

template <typename T>
T readScalar(const YAML::Node& node,
             const std::string& field,
             const char* expected,
             const std::string& source) {
  if (!node.IsScalar()) {
    throw ConfigParseError(std::string("expected ") + expected, field, source,
                           lineOf(node));
  }
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion&) {
    throw ConfigParseError(std::string("expected ") + expected + ", got '" +
                               node.Scalar() + "'",
                           field, source, lineOf(node));
  }
}

logging::LogLevel parseLevel(const YAML::Node& node,
                             const std::string& source) {
  std::string name = readScalar<std::string>(node, "logging.level",
                                             "a log level", source);
  static const char* const kLevels[] = {"debug",   "info",     "notice",
                                        "warning", "error",    "critical",
                                        "alert",   "emergency", "off"};
  std::string lowered;
  for (char c : name) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (const char* level : kLevels) {
    if (lowered == level) {
      return logging::stringToLogLevel(lowered);
    }
  }
  throw ConfigParseError("unknown log level '" + name + "'", "logging.level",
                         source, lineOf(node));
}

void parseLogging(const YAML::Node& node,
                  LoggingConfig& settings,
                  const std::string& source) {
  if (!node.IsMap()) {
    throw ConfigParseError("expected a mapping", "logging", source,
                           lineOf(node));
  }
  if (node["level"]) {
    settings.level = parseLevel(node["level"], source);
  }
  if (node["sink"]) {
    settings.sink = readScalar<std::string>(node["sink"], "logging.sink",
                                           "a sink name", source);
    if (settings.sink != "stderr" && settings.sink != "stdout" &&
        settings.sink != "file" && settings.sink != "syslog" &&
        settings.sink != "null") {
      throw ConfigParseError("unknown sink '" + settings.sink + "'",
                             "logging.sink", source, lineOf(node["sink"]));
    }
  }
  if (node["file"]) {
    settings.file = readScalar<std::string>(node["file"], "logging.file",
                                           "a file name", source);
  }
  if (node["format"]) {
    settings.format = readScalar<std::string>(node["format"], "logging.format",
                                             "a format name", source);
    if (settings.format != "default" && settings.format != "json") {
      throw ConfigParseError("unknown format '" + settings.format + "'",
                             "logging.format", source,
                             lineOf(node["format"]));
    }
  }
  if (settings.sink == "file" && settings.file.empty()) {
    throw ConfigParseError("file sink requires logging.file", "logging.file",
                           source, lineOf(node));
  }
}

}  // namespace

std::vector<std::string> ConfigLoader::searchPaths() const {
  std::vector<std::string> paths;
  if (!explicit_path_.empty()) {
    paths.push_back(explicit_path_);
    return paths;
  }
  const char* env_config = std::getenv("FSESL_CONFIG");
  if (env_config && *env_config) {
    paths.push_back(env_config);
  }
  paths.push_back("./config/fsesl.yaml");
  paths.push_back("./fsesl.yaml");
  paths.push_back("/etc/fsesl/fsesl.yaml");
  return paths;
}

std::string ConfigLoader::findConfigFile() const {
  for (const auto& path : searchPaths()) {
    if (fileExists(path)) {
      FSESL_LOG(Debug, "Configuration file chosen: {}", path);
      return path;
    }
  }
  return "";
}

ClientConfig ConfigLoader::load() const {
  if (!explicit_path_.empty() && !fileExists(explicit_path_)) {
    throw ConfigParseError("file not found", "", explicit_path_);
  }
  std::string path = findConfigFile();
  if (path.empty()) {
    FSESL_LOG(Info, "No configuration file found, using defaults");
    return ClientConfig();
  }
  return loadFile(path);
}

ClientConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigParseError("cannot open file", "", path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  ClientConfig config =
      parse(substituteEnvironmentVariables(buffer.str(), path), path);
  config.source_file = path;
  FSESL_LOG(Info, "Loaded configuration from {}", path);
  return config;
}

ClientConfig ConfigLoader::parse(const std::string& content,
                                 const std::string& source) {
  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    throw ConfigParseError("YAML parse error: " + e.msg, "", source,
                           e.mark.line + 1);
  }

  ClientConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigParseError("top level must be a mapping", "", source,
                           lineOf(root));
  }

  for (const auto& entry : root) {
    std::string key = entry.first.as<std::string>();
    bool known = false;
    for (const char* k : kKnownKeys) {
      known = known || key == k;
    }
    if (!known) {
      FSESL_LOG(Warning, "Ignoring unknown configuration key '{}' in {}", key,
                source.empty() ? "<string>" : source);
    }
  }

  EventSocketConfig& socket = config.pool.socket;
  if (root["address"]) {
    socket.address = readScalar<std::string>(root["address"], "address",
                                             "host:port", source);
  }
  if (root["password"]) {
    socket.password = readScalar<std::string>(root["password"], "password",
                                              "a string", source);
  }
  if (root["reconnects"]) {
    socket.reconnects =
        readScalar<int>(root["reconnects"], "reconnects", "an integer", source);
    if (socket.reconnects < 1) {
      throw ConfigParseError("must be at least 1", "reconnects", source,
                             lineOf(root["reconnects"]));
    }
  }
  if (root["backoff_ms"]) {
    long backoff = readScalar<long>(root["backoff_ms"], "backoff_ms",
                                    "an integer", source);
    if (backoff < 0) {
      throw ConfigParseError("must not be negative", "backoff_ms", source,
                             lineOf(root["backoff_ms"]));
    }
    socket.backoff_unit = std::chrono::milliseconds(backoff);
  }
  if (root["read_events"]) {
    socket.read_events = readScalar<bool>(root["read_events"], "read_events",
                                          "a boolean", source);
  }
  if (root["max_connections"]) {
    int max = readScalar<int>(root["max_connections"], "max_connections",
                              "an integer", source);
    if (max < 1) {
      throw ConfigParseError("must be at least 1", "max_connections", source,
                             lineOf(root["max_connections"]));
    }
    config.pool.max_connections = static_cast<size_t>(max);
  }
  if (root["events"]) {
    const YAML::Node& events = root["events"];
    if (!events.IsSequence()) {
      throw ConfigParseError("expected a list of event names", "events",
                             source, lineOf(events));
    }
    for (size_t i = 0; i < events.size(); ++i) {
      config.events.push_back(readScalar<std::string>(
          events[i], "events[" + std::to_string(i) + "]", "an event name",
          source));
    }
  }
  if (root["filters"]) {
    const YAML::Node& filters = root["filters"];
    if (!filters.IsMap()) {
      throw ConfigParseError("expected a mapping of header to value",
                             "filters", source, lineOf(filters));
    }
    for (const auto& filter : filters) {
      std::string header = filter.first.as<std::string>();
      socket.event_filters.emplace_back(
          header, readScalar<std::string>(filter.second, "filters." + header,
                                          "a string", source));
    }
  }
  if (root["logging"]) {
    parseLogging(root["logging"], config.logging, source);
  }
  return config;
}

std::string ConfigLoader::substituteEnvironmentVariables(
    const std::string& content, const std::string& source) {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");

  std::string result;
  auto begin = std::sregex_iterator(content.begin(), content.end(), env_regex);
  auto end = std::sregex_iterator();
  size_t last = 0;
  for (auto it = begin; it != end; ++it) {
    const std::smatch& match = *it;
    std::string name = match[1].str();
    const char* value = std::getenv(name.c_str());
    if (!value && !match[2].matched) {
      throw ConfigParseError("undefined environment variable ${" + name + "}",
                             "", source);
    }
    result.append(content, last, match.position(0) - last);
    result += value ? value : match[3].str();
    last = match.position(0) + match.length(0);
  }
  result.append(content, last, std::string::npos);
  return result;
}

std::shared_ptr<logging::LogSink> ConfigLoader::createSink(
    const LoggingConfig& settings) {
  std::shared_ptr<logging::LogSink> sink;
  if (settings.sink == "stdout") {
    sink = logging::SinkFactory::createStdioSink(false);
  } else if (settings.sink == "file") {
    if (settings.file.empty()) {
      throw ConfigParseError("file sink requires logging.file",
                             "logging.file");
    }
    sink = logging::SinkFactory::createFileSink(settings.file);
  } else if (settings.sink == "syslog") {
    sink = logging::SinkFactory::createSyslogSink("fsesl");
  } else if (settings.sink == "null") {
    sink = logging::SinkFactory::createNullSink();
  } else {
    sink = logging::SinkFactory::createStdioSink(true);
  }
  if (settings.format == "json") {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  return sink;
}

void ConfigLoader::applyLogging(const LoggingConfig& settings) {
  auto& registry = logging::LoggerRegistry::instance();
  registry.setDefaultSink(createSink(settings));
  registry.setGlobalLevel(settings.level);
}

}  // namespace config
}  // namespace fsesl
