/* @file CoinSteps.cpp
 * @brief coin toss steps and their JSON payloads
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <random>
#include <stdexcept>
#include <utility>

// Stepwise headers
#include "steps/CoinSteps.hpp"

namespace stepwise {
  namespace steps {

    namespace {
      CoinSource& coinSource() {
        static CoinSource source;
        return source;
      }

      Coin randomCoin() {
        static std::mt19937 rng{ std::random_device{}() };
        std::bernoulli_distribution heads(0.5);
        return heads(rng) ? Coin::Heads : Coin::Tails;
      }
    } // namespace

    void setCoinSource(CoinSource source) { coinSource() = std::move(source); }

    Coin tossCoin() {
      auto& source = coinSource();
      return source ? source() : randomCoin();
    }

    std::optional<CoinMachine> FirstToss::next() && {
      Coin first = tossCoin();
      std::cout << "First coin: " << toString(first) << "\n";
      return SecondToss{ first };
    }

    std::optional<CoinMachine> SecondToss::next() && {
      Coin second = tossCoin();
      std::cout << "Second coin: " << toString(second) << "\n";
      if (second != firstCoin)
        throw std::runtime_error("Coins landed differently");
      std::cout << "Coins match\n";
      return std::nullopt;
    }

    void to_json(nlohmann::json& j, const FirstToss&) { j = nlohmann::json::object(); }

    void from_json(const nlohmann::json& j, FirstToss&) {
      if (!j.is_object() && !j.is_null())
        throw std::invalid_argument("FirstToss payload must be an object");
    }

    void to_json(nlohmann::json& j, const SecondToss& step) {
      j = nlohmann::json{ { "first_coin", step.firstCoin } };
    }

    void from_json(const nlohmann::json& j, SecondToss& step) {
      const auto& coin = j.at("first_coin");
      if (coin != "Heads" && coin != "Tails")
        throw std::invalid_argument("unknown coin side: " + coin.dump());
      coin.get_to(step.firstCoin);
    }

  } // namespace steps
} // namespace stepwise
