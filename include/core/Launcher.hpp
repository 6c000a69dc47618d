#pragma once
/** @file  Launcher.hpp
 *  @brief Shared entry-point plumbing for engine-driven command-line programs.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/Engine.hpp"
#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"

namespace stepwise {
  namespace core {

    enum ExitCode : int { kExitOk = 0, kExitStepFailed = 1, kExitSetupFailed = 2 };

    /**
 * @struct RunOptions
 * @brief Parsed command line: `[--store PATH] [--config FILE] [--ack] [ARGS...]`.
 */
    struct RunOptions {
      std::optional<std::filesystem::path> storePath{};
      std::optional<std::string> configPath{};
      bool acknowledge{ false }; ///< --ack: drop a pending error before running
      bool help{ false };
      std::vector<std::string> arguments{}; ///< positional, program specific
    };

    /// Throws std::invalid_argument on unknown flags or a flag missing its value.
    RunOptions parseRunOptions(int argc, const char* const* argv);

    std::string usage(const std::string& program, const std::string& positional = "");

    /// Config file, then environment, then command line; later sources win.
    EngineConfig resolveConfig(const RunOptions& options);

    /**
     * @brief restore → optional dropError → run, reporting failures on \p err.
     * @returns kExitOk, kExitStepFailed for step failures (pending ones included),
     *          kExitSetupFailed for config and store failures.
     */
    template <typename State>
    int launch(State initial, const RunOptions& options, std::ostream& err = std::cerr) {
      try {
        EngineConfig config = resolveConfig(options);
        auto logger = makeLogger(config, &std::clog);
        Engine<State> engine(std::move(initial), makeStore(config), logger);

        engine.restore();
        if (options.acknowledge)
          engine.dropError();
        engine.run();
        return kExitOk;
      } catch (const StepError& e) {
        err << "Error: " << e.what() << "\n";
        return kExitStepFailed;
      } catch (const std::exception& e) {
        err << "Error: " << formatErrorChain(e) << "\n";
        return kExitSetupFailed;
      }
    }

  } // namespace core
} // namespace stepwise
