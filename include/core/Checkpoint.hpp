#pragma once
/** @file  Checkpoint.hpp
 *  @brief The durable `{state, error}` record of one machine instance.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace stepwise {
  namespace core {

    /**
 * @struct Checkpoint
 * @brief Where a machine currently stands.
 *
 *  * `error` is set only between a failed transition and its acknowledgement.
 *  * While `error` is set, `state` is the state that was current before the
 *    failing attempt.
 *
 *  JSON form: `{"state": <tagged state>, "error": "text" | null}`.
 */
    template <typename State> struct Checkpoint {
      State state;
      std::optional<std::string> error{};

      nlohmann::json toJson() const {
        nlohmann::json j;
        j["state"] = state;
        j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
        return j;
      }

      /// Throws nlohmann::json exceptions (or the state's own) on a malformed record.
      static Checkpoint fromJson(const nlohmann::json& j) {
        Checkpoint checkpoint{ j.at("state").template get<State>() };
        if (auto it = j.find("error"); it != j.end() && !it->is_null())
          checkpoint.error = it->template get<std::string>();
        return checkpoint;
      }
    };

  } // namespace core
} // namespace stepwise
