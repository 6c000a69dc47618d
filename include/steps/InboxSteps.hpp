#pragma once
/** @file  InboxSteps.hpp
 *  @brief Inbox report program: check a directory, count its files, write a
 *         report next to them.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Machine.hpp"

namespace stepwise {
  namespace steps {

    struct CheckInbox;
    struct CountFiles;
    struct WriteReport;
    using InboxMachine = core::Machine<CheckInbox, CountFiles, WriteReport>;

    /// Name of the report file written into the inbox directory.
    inline constexpr const char* kInboxReportName = "inbox-report.txt";

    /// Fails while the directory is missing; create it and run again.
    struct CheckInbox {
      static constexpr const char* kName = "CheckInbox";
      std::string dir;

      std::optional<InboxMachine> next() &&;
      bool operator==(const CheckInbox& other) const { return dir == other.dir; }
    };

    struct CountFiles {
      static constexpr const char* kName = "CountFiles";
      std::string dir;

      std::optional<InboxMachine> next() &&;
      bool operator==(const CountFiles& other) const { return dir == other.dir; }
    };

    struct WriteReport {
      static constexpr const char* kName = "WriteReport";
      std::string dir;
      std::size_t fileCount{ 0 };

      std::optional<InboxMachine> next() &&;
      bool operator==(const WriteReport& other) const {
        return dir == other.dir && fileCount == other.fileCount;
      }
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CheckInbox, dir)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CountFiles, dir)

    void to_json(nlohmann::json& j, const WriteReport& step);
    void from_json(const nlohmann::json& j, WriteReport& step);

  } // namespace steps
} // namespace stepwise
