#pragma once
/** @file  MemoryStore.hpp
 *  @brief CheckpointStore kept in process memory.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "io/CheckpointStore.hpp"

namespace stepwise {
  namespace io {

    /**
 * @class MemoryStore
 * @brief Keeps the record in a member; nothing survives the process.
 *
 *  * Gives callers the engine's rollback and error-gating semantics without
 *    touching the filesystem.
 */
    class MemoryStore : public CheckpointStore {
    public:
      explicit MemoryStore(std::string name = "memory");

      std::optional<nlohmann::json> load() override;
      void save(const nlohmann::json& record) override;
      void clean() override;
      std::string location() const override;

      bool empty() const { return !record_.has_value(); }

    private:
      std::string name_;
      std::optional<nlohmann::json> record_{};
    };

  } // namespace io
} // namespace stepwise
