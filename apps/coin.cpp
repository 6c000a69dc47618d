/* @file coin.cpp
 * @brief tosses two coins; rerun after a mismatch to retry the second toss
 *
 * © 2025 Stepwise — MIT-licensed.
 */

#include <iostream>

#include "core/Launcher.hpp"
#include "steps/CoinSteps.hpp"

using namespace stepwise;

int main(int argc, char** argv) {
  core::RunOptions options;
  try {
    options = core::parseRunOptions(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n" << core::usage(argv[0]);
    return core::kExitSetupFailed;
  }
  if (options.help) {
    std::cout << core::usage(argv[0]);
    return core::kExitOk;
  }

  return core::launch<steps::CoinMachine>(steps::FirstToss{}, options);
}
