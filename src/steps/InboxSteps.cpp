/* @file InboxSteps.cpp
 * @brief filesystem steps of the inbox report program
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

// Stepwise headers
#include "steps/InboxSteps.hpp"

namespace fs = std::filesystem;

namespace stepwise {
  namespace steps {

    std::optional<InboxMachine> CheckInbox::next() && {
      std::error_code ec;
      auto status = fs::status(dir, ec);
      if (ec || !fs::exists(status)) {
        try {
          throw std::system_error(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                                  dir);
        } catch (...) {
          std::throw_with_nested(std::runtime_error("inbox `" + dir + "` is missing"));
        }
      }
      if (!fs::is_directory(status))
        throw std::runtime_error("inbox `" + dir + "` is not a directory");

      std::cout << "Inbox found: " << dir << "\n";
      return CountFiles{ std::move(dir) };
    }

    std::optional<InboxMachine> CountFiles::next() && {
      std::size_t count = 0;
      std::error_code ec;
      for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().filename() != kInboxReportName)
          ++count;
      }
      if (ec) {
        try {
          throw std::system_error(ec, dir);
        } catch (...) {
          std::throw_with_nested(std::runtime_error("can't list inbox `" + dir + "`"));
        }
      }

      std::cout << "Files in inbox: " << count << "\n";
      return WriteReport{ std::move(dir), count };
    }

    std::optional<InboxMachine> WriteReport::next() && {
      const fs::path report = fs::path(dir) / kInboxReportName;
      std::ofstream out(report, std::ios::trunc);
      if (!out)
        throw std::runtime_error("can't open report `" + report.string() + "`");
      out << "files: " << fileCount << "\n";
      out.close();
      if (out.fail())
        throw std::runtime_error("can't write report `" + report.string() + "`");

      std::cout << "Report written: " << report.string() << "\n";
      return std::nullopt;
    }

    void to_json(nlohmann::json& j, const WriteReport& step) {
      j = nlohmann::json{ { "dir", step.dir }, { "file_count", step.fileCount } };
    }

    void from_json(const nlohmann::json& j, WriteReport& step) {
      j.at("dir").get_to(step.dir);
      j.at("file_count").get_to(step.fileCount);
    }

  } // namespace steps
} // namespace stepwise
