#pragma once
/** @file  CheckpointStore.hpp
 *  @brief Persistence port for the engine's durable checkpoint record.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json_fwd.hpp>

namespace stepwise {
  namespace io {

    /**
 * @class CheckpointStore
 * @brief Load/save/clean of one encoded checkpoint at a fixed location.
 *
 *  * Records are the self-describing JSON form produced by core::Checkpoint.
 *  * One location holds exactly one record; implementations assume a single
 *    writer and do no locking.
 *  * Every failure is reported as core::StoreError.
 */
    class CheckpointStore {
    public:
      virtual ~CheckpointStore() = default;

      /// std::nullopt means no prior run, or the prior run completed.
      virtual std::optional<nlohmann::json> load() = 0;

      /// Writes or overwrites the single record.
      virtual void save(const nlohmann::json& record) = 0;

      /// Removes the record. Removing an absent record is a no-op.
      virtual void clean() = 0;

      /// Human-readable location, for log lines and error messages.
      virtual std::string location() const = 0;
    };

  } // namespace io
} // namespace stepwise
