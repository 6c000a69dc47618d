#pragma once
/** @file  Errors.hpp
 *  @brief Exception types raised by the engine and its stores.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <string>

namespace stepwise {
  namespace core {

    /**
 * @class StoreError
 * @brief I/O or codec failure while loading, saving or cleaning a checkpoint.
 *
 *  * Always fatal to the current engine call.
 *  * The OS / parser error that caused it is nested (`std::throw_with_nested`).
 */
    class StoreError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class StepError
 * @brief A step failed; `what()` holds the failure text with its causal chain.
 *
 *  * The failure is recorded in the checkpoint and blocks later runs until
 *    `Engine::dropError()` is called.
 */
    class StepError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Raised by `Engine::run()` when the checkpoint still carries an unacknowledged error.
    class PendingStepError : public StepError {
    public:
      using StepError::StepError;
    };

    /**
     * @brief Renders \p e followed by every nested cause, outermost first.
     *
     * Layout: `<message>` and, when causes exist, `\nCaused by:` followed by one
     * `\n\t<cause>` line per nested exception.
     */
    std::string formatErrorChain(const std::exception& e);

    /// Same as above for an arbitrary captured exception (non-std ones render as "unknown error").
    std::string formatErrorChain(std::exception_ptr eptr);

  } // namespace core
} // namespace stepwise
