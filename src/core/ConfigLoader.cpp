/* @file ConfigLoader.cpp
 * @brief reads and parses JSON config files
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <exception>
#include <fstream>
#include <stdexcept>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Stepwise headers
#include "core/ConfigLoader.hpp"

using namespace stepwise::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] can't open config file: " + path_);

  try {
    auto config = nlohmann::json::parse(in);
    if (!config.is_object())
      throw std::runtime_error("[ConfigLoader] config root must be an object: " + path_);
    return config;
  } catch (const nlohmann::json::parse_error&) {
    std::throw_with_nested(std::runtime_error("[ConfigLoader] malformed JSON in " + path_));
  }
}
