/* @file Launcher.cpp
 * @brief command-line parsing and config resolution for the apps
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// Stepwise headers
#include "core/ConfigLoader.hpp"
#include "core/Launcher.hpp"

// third-party headers
#include <nlohmann/json.hpp>

namespace stepwise {
  namespace core {

    RunOptions parseRunOptions(int argc, const char* const* argv) {
      RunOptions options;
      for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> std::string {
          if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + arg);
          return argv[++i];
        };

        if (arg == "--store")
          options.storePath = value();
        else if (arg == "--config")
          options.configPath = value();
        else if (arg == "--ack")
          options.acknowledge = true;
        else if (arg == "--help" || arg == "-h")
          options.help = true;
        else if (arg.size() > 1 && arg[0] == '-')
          throw std::invalid_argument("unknown option " + arg);
        else
          options.arguments.push_back(arg);
      }
      return options;
    }

    std::string usage(const std::string& program, const std::string& positional) {
      std::string text = "usage: " + program + " [--store PATH] [--config FILE] [--ack]";
      if (!positional.empty())
        text += " " + positional;
      text += "\n"
              "  --store PATH   checkpoint file (default: <executable>.json)\n"
              "  --config FILE  JSON config with store_path, log_level, log_file\n"
              "  --ack          acknowledge the previous failure and retry its step\n";
      return text;
    }

    EngineConfig resolveConfig(const RunOptions& options) {
      EngineConfig config;
      if (options.configPath)
        config = EngineConfig::fromJson(ConfigLoader(*options.configPath).load());
      config.applyEnvironment();
      if (options.storePath)
        config.storePath = options.storePath;
      return config;
    }

  } // namespace core
} // namespace stepwise
