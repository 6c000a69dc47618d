#pragma once
/** @file  Machine.hpp
 *  @brief Closed set of steps a resumable program moves through.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

// third-party headers
#include <nlohmann/json.hpp>

namespace stepwise {
  namespace core {

    /**
 * @class Machine
 * @brief Tagged union over the step types of one program.
 *
 *  Every step type must provide
 *    * `static constexpr const char* kName`, unique within the machine,
 *    * `std::optional<Machine<...>> next() &&`, throwing on failure,
 *    * `to_json` / `from_json` overloads found by ADL, and a default constructor.
 *
 *  Serialized form is `{"<kName>": <step payload>}`, so a record decodes back
 *  into the right step without outside hints.
 */
    template <typename... Steps> class Machine {
      static_assert(sizeof...(Steps) > 0, "a machine needs at least one step");

      template <typename Step>
      static constexpr bool isStep = (std::is_same_v<std::decay_t<Step>, Steps> || ...);

    public:
      using Variant = std::variant<Steps...>;

      /// Implicit so a step can be returned where a machine is expected.
      template <typename Step, typename = std::enable_if_t<isStep<Step>>>
      Machine(Step&& step) : step_(std::forward<Step>(step)) {}

      /// Runs the active step. std::nullopt means the program is finished.
      std::optional<Machine> transition() && {
        return std::visit(
            [](auto&& step) -> std::optional<Machine> { return std::move(step).next(); },
            std::move(step_));
      }

      std::string_view name() const {
        return std::visit(
            [](const auto& step) { return std::string_view(std::decay_t<decltype(step)>::kName); },
            step_);
      }

      template <typename Step> bool holds() const { return std::holds_alternative<Step>(step_); }
      template <typename Step> const Step& get() const { return std::get<Step>(step_); }

      nlohmann::json toJson() const {
        return std::visit(
            [](const auto& step) {
              nlohmann::json j = nlohmann::json::object();
              j[std::decay_t<decltype(step)>::kName] = step;
              return j;
            },
            step_);
      }

      /// Throws std::invalid_argument on a malformed record or an unknown step name.
      static Machine fromJson(const nlohmann::json& j) {
        if (!j.is_object() || j.size() != 1)
          throw std::invalid_argument("step record must be an object with exactly one key");

        auto it = j.begin();
        const std::string& tag = it.key();
        std::optional<Machine> decoded;
        ((tag == Steps::kName ? (decoded.emplace(it.value().template get<Steps>()), true)
                              : false) ||
         ...);
        if (!decoded)
          throw std::invalid_argument("unknown step `" + tag + "`");
        return std::move(*decoded);
      }

      friend bool operator==(const Machine& a, const Machine& b) { return a.step_ == b.step_; }
      friend bool operator!=(const Machine& a, const Machine& b) { return !(a == b); }

    private:
      Variant step_;
    };

  } // namespace core
} // namespace stepwise

namespace nlohmann {
  // Machine has no default constructor, so it decodes through a serializer.
  template <typename... Steps> struct adl_serializer<stepwise::core::Machine<Steps...>> {
    static stepwise::core::Machine<Steps...> from_json(const json& j) {
      return stepwise::core::Machine<Steps...>::fromJson(j);
    }
    static void to_json(json& j, const stepwise::core::Machine<Steps...>& m) { j = m.toJson(); }
  };
} // namespace nlohmann
