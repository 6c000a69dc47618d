#pragma once
/** @file  EngineConfig.hpp
 *  @brief Run-time settings for an engine-driven program and the factories
 *         that turn them into a logger and a checkpoint store.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "core/Logger.hpp"

namespace stepwise::io {
  class CheckpointStore;
} // namespace stepwise::io

namespace stepwise::core {

  /**
 * @struct EngineConfig
 * @brief Where to keep the checkpoint and how loudly to log.
 *
 *  JSON keys (all optional): `store_path`, `log_level`, `log_file`.
 *  Environment overrides: `STEPWISE_STORE`, `STEPWISE_LOG`.
 */
  struct EngineConfig {
    std::optional<std::filesystem::path> storePath{}; ///< unset → io::defaultStorePath()
    LogLevel logLevel{ LogLevel::Warn };
    std::optional<std::filesystem::path> logFile{};

    /// Throws std::runtime_error on wrong value types or unknown level names.
    static EngineConfig fromJson(const nlohmann::json& j);

    /// Overlays STEPWISE_STORE / STEPWISE_LOG when they are set and non-empty.
    void applyEnvironment();
  };

  /// Logger at the configured level, writing to \p console and, if set, the log file.
  std::shared_ptr<Logger> makeLogger(const EngineConfig& config, std::ostream* console);

  /// JsonFileStore at the configured path, or at the default location.
  std::shared_ptr<io::CheckpointStore> makeStore(const EngineConfig& config);

} // namespace stepwise::core
