/* @file JsonFileStore.cpp
 * @brief file-backed checkpoint persistence (read / atomic write / remove)
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <exception>
#include <fstream>
#include <iterator>
#include <system_error>

// Stepwise headers
#include "core/Errors.hpp"
#include "io/JsonFileStore.hpp"

namespace fs = std::filesystem;

namespace stepwise {
  namespace io {

    namespace {
      // Throws StoreError(message) with the OS error nested as its cause.
      [[noreturn]] void raiseStoreError(const std::string& message, std::error_code ec) {
        try {
          throw std::system_error(ec);
        } catch (...) {
          std::throw_with_nested(core::StoreError(message));
        }
      }

      std::error_code lastError() {
        return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
      }

      std::string quoted(const fs::path& p) { return "`" + p.string() + "`"; }
    } // namespace

    fs::path storePathForExecutable(const fs::path& exe) {
      if (!exe.has_stem())
        raiseStoreError("can't find executable stem", std::make_error_code(std::errc::invalid_argument));

      // `tool.v2.bin` → stem `tool.v2` → `tool.json`
      fs::path name = exe.stem();
      name.replace_extension(".json");
      return exe.parent_path() / name;
    }

    fs::path defaultStorePath() {
      std::error_code ec;
      fs::path exe = fs::read_symlink("/proc/self/exe", ec);
      if (ec)
        raiseStoreError("can't find executable stem", ec);
      return storePathForExecutable(exe);
    }

    JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)) {}

    std::shared_ptr<JsonFileStore> JsonFileStore::atDefaultLocation() {
      return std::make_shared<JsonFileStore>(defaultStorePath());
    }

    std::optional<nlohmann::json> JsonFileStore::load() {
      std::error_code ec;
      if (!fs::exists(path_, ec)) {
        if (ec)
          raiseStoreError("can't read file " + quoted(path_), ec);
        return std::nullopt;
      }

      errno = 0;
      std::ifstream in(path_, std::ios::binary);
      if (!in)
        raiseStoreError("can't read file " + quoted(path_), lastError());

      std::string text{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
      if (in.bad())
        raiseStoreError("can't read file " + quoted(path_), lastError());

      try {
        return nlohmann::json::parse(text);
      } catch (const nlohmann::json::parse_error&) {
        std::throw_with_nested(core::StoreError("can't decode json: " + text));
      }
    }

    void JsonFileStore::save(const nlohmann::json& record) {
      std::string text;
      try {
        text = record.dump(kIndent);
      } catch (const nlohmann::json::type_error&) {
        std::throw_with_nested(core::StoreError("can't encode state into json: " + location()));
      }

      fs::path tmp = path_;
      tmp += ".tmp";

      errno = 0;
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out)
        raiseStoreError("can't write file " + quoted(path_), lastError());
      out << text;
      out.close();
      if (out.fail())
        raiseStoreError("can't write file " + quoted(path_), lastError());

      std::error_code ec;
      fs::rename(tmp, path_, ec);
      if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        raiseStoreError("can't write file " + quoted(path_), ec);
      }
    }

    void JsonFileStore::clean() {
      std::error_code ec;
      // remove() reports false without an error when the file is already gone
      fs::remove(path_, ec);
      if (ec)
        raiseStoreError("can't remove file " + quoted(path_), ec);
    }

    std::string JsonFileStore::location() const { return path_.string(); }

  } // namespace io
} // namespace stepwise
