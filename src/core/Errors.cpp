/* @file Errors.cpp
 * @brief causal-chain formatting for nested exceptions
 *
 * © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <string>

// Stepwise headers
#include "core/Errors.hpp"

namespace stepwise {
  namespace core {

    namespace {
      constexpr const char* kUnknownError = "unknown error";

      // Appends the causes nested inside e, one per line.
      void appendCauses(const std::exception& e, std::string& out, bool& header) {
        try {
          std::rethrow_if_nested(e);
        } catch (const std::exception& cause) {
          if (!header) {
            out += "\nCaused by:";
            header = true;
          }
          out += "\n\t";
          out += cause.what();
          appendCauses(cause, out, header);
        } catch (...) {
          if (!header) {
            out += "\nCaused by:";
            header = true;
          }
          out += "\n\t";
          out += kUnknownError;
        }
      }
    } // namespace

    std::string formatErrorChain(const std::exception& e) {
      std::string out = e.what();
      bool header = false;
      appendCauses(e, out, header);
      return out;
    }

    std::string formatErrorChain(std::exception_ptr eptr) {
      if (!eptr)
        return kUnknownError;
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception& e) {
        return formatErrorChain(e);
      } catch (...) {
        return kUnknownError;
      }
    }

  } // namespace core
} // namespace stepwise
