#pragma once
/** @file  CoinSteps.hpp
 *  @brief Two-coin toss program: both coins must land on the same side.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <functional>
#include <optional>

// third-party headers
#include <nlohmann/json.hpp>

// Stepwise headers
#include "core/Machine.hpp"

namespace stepwise {
  namespace steps {

    enum class Coin { Heads, Tails };

    NLOHMANN_JSON_SERIALIZE_ENUM(Coin, { { Coin::Heads, "Heads" }, { Coin::Tails, "Tails" } })

    inline const char* toString(Coin c) { return c == Coin::Heads ? "Heads" : "Tails"; }

    /// Where tosses come from. An empty function restores the random source.
    using CoinSource = std::function<Coin()>;
    void setCoinSource(CoinSource source);
    Coin tossCoin();

    struct FirstToss;
    struct SecondToss;
    using CoinMachine = core::Machine<FirstToss, SecondToss>;

    /// Tosses the first coin and remembers it for the second step.
    struct FirstToss {
      static constexpr const char* kName = "FirstToss";

      std::optional<CoinMachine> next() &&;

      bool operator==(const FirstToss&) const { return true; }
    };

    /// Tosses again; throws "Coins landed differently" on a mismatch.
    struct SecondToss {
      static constexpr const char* kName = "SecondToss";

      Coin firstCoin{ Coin::Heads };

      std::optional<CoinMachine> next() &&;

      bool operator==(const SecondToss& other) const { return firstCoin == other.firstCoin; }
    };

    void to_json(nlohmann::json& j, const FirstToss& step);
    void from_json(const nlohmann::json& j, FirstToss& step);
    void to_json(nlohmann::json& j, const SecondToss& step);
    void from_json(const nlohmann::json& j, SecondToss& step);

  } // namespace steps
} // namespace stepwise
