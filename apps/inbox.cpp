/* @file inbox.cpp
 * @brief counts the files of an inbox directory and writes a report into it
 *
 * © 2025 Stepwise — MIT-licensed.
 */

#include <iostream>
#include <utility>

#include "core/Launcher.hpp"
#include "steps/InboxSteps.hpp"

using namespace stepwise;

int main(int argc, char** argv) {
  core::RunOptions options;
  try {
    options = core::parseRunOptions(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n" << core::usage(argv[0], "[DIR]");
    return core::kExitSetupFailed;
  }
  if (options.help || options.arguments.size() > 1) {
    std::cout << core::usage(argv[0], "[DIR]");
    return options.help ? core::kExitOk : core::kExitSetupFailed;
  }

  // a restored checkpoint takes precedence over DIR
  steps::CheckInbox first{ options.arguments.empty() ? "inbox" : options.arguments.front() };
  return core::launch<steps::InboxMachine>(std::move(first), options);
}
