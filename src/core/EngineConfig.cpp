/* @file EngineConfig.cpp
 * @brief JSON / environment parsing of EngineConfig and collaborator factories
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <stdexcept>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// Stepwise headers
#include "core/EngineConfig.hpp"
#include "io/JsonFileStore.hpp"

namespace stepwise::core {

  namespace {
    constexpr const char* kStorePathKey = "store_path";
    constexpr const char* kLogLevelKey = "log_level";
    constexpr const char* kLogFileKey = "log_file";

    constexpr const char* kStoreEnv = "STEPWISE_STORE";
    constexpr const char* kLogEnv = "STEPWISE_LOG";

    std::string requireString(const nlohmann::json& j, const char* key) {
      const auto& value = j.at(key);
      if (!value.is_string())
        throw std::runtime_error(std::string("[EngineConfig] `") + key + "` must be a string");
      return value.get<std::string>();
    }

    LogLevel requireLevel(const std::string& name) {
      auto level = parseLogLevel(name);
      if (!level)
        throw std::runtime_error("[EngineConfig] unknown log level: " + name);
      return *level;
    }
  } // namespace

  EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
      throw std::runtime_error("[EngineConfig] config must be a JSON object");

    EngineConfig config;
    if (j.contains(kStorePathKey))
      config.storePath = requireString(j, kStorePathKey);
    if (j.contains(kLogLevelKey))
      config.logLevel = requireLevel(requireString(j, kLogLevelKey));
    if (j.contains(kLogFileKey))
      config.logFile = requireString(j, kLogFileKey);
    return config;
  }

  void EngineConfig::applyEnvironment() {
    if (const char* store = std::getenv(kStoreEnv); store && *store)
      storePath = store;
    if (const char* level = std::getenv(kLogEnv); level && *level)
      logLevel = requireLevel(level);
  }

  std::shared_ptr<Logger> makeLogger(const EngineConfig& config, std::ostream* console) {
    auto logger = std::make_shared<Logger>(config.logLevel, console);
    if (config.logFile && !logger->attachFile(config.logFile->string()))
      throw std::runtime_error("[EngineConfig] can't open log file: " + config.logFile->string());
    return logger;
  }

  std::shared_ptr<io::CheckpointStore> makeStore(const EngineConfig& config) {
    if (config.storePath)
      return std::make_shared<io::JsonFileStore>(*config.storePath);
    return io::JsonFileStore::atDefaultLocation();
  }

} // namespace stepwise::core
