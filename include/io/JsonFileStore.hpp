#pragma once
/** @file  JsonFileStore.hpp
 *  @brief Default CheckpointStore: one pretty-printed JSON file per machine.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// Stepwise headers
#include "io/CheckpointStore.hpp"

namespace stepwise {
  namespace io {

    /**
     * @brief Store file for an executable: its file stem with the last extension
     *        replaced by `.json`, in the executable's directory.
     *
     * `/opt/bin/backup` → `/opt/bin/backup.json`, `/opt/bin/tool.v2.bin` → `/opt/bin/tool.json`.
     * Throws core::StoreError when the path has no stem.
     */
    std::filesystem::path storePathForExecutable(const std::filesystem::path& exe);

    /// storePathForExecutable() of /proc/self/exe; throws core::StoreError when it can't be resolved.
    std::filesystem::path defaultStorePath();

    /**
 * @class JsonFileStore
 * @brief Persists the checkpoint as a JSON file at a fixed path.
 *
 *  * Missing file on `load()` means "nothing to resume".
 *  * `save()` writes `<path>.tmp` and renames it into place, so a crash in the
 *    middle of a write leaves the previous record intact.
 *  * `clean()` of a missing file is a no-op.
 */
    class JsonFileStore : public CheckpointStore {
    public:
      explicit JsonFileStore(std::filesystem::path path);

      /// Store located at defaultStorePath().
      static std::shared_ptr<JsonFileStore> atDefaultLocation();

      //---CheckpointStore--------------------------------------------------
      std::optional<nlohmann::json> load() override;
      void save(const nlohmann::json& record) override;
      void clean() override;
      std::string location() const override;

      const std::filesystem::path& path() const { return path_; }

    private:
      static constexpr int kIndent = 4;

      std::filesystem::path path_;
    };

  } // namespace io
} // namespace stepwise
