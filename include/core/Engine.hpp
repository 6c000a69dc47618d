#pragma once
/** @file  Engine.hpp
 *  @brief Runs a machine step by step, persisting after every step so an
 *         interrupted program resumes where it failed.
 *
 *  © 2025 Stepwise — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// Stepwise headers
#include "core/Checkpoint.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/CheckpointStore.hpp"

namespace stepwise {
  namespace core {

    enum class EnginePhase : std::uint8_t { Fresh, Restored, Running, Completed, Failed };

    inline const char* toString(EnginePhase p) {
      switch (p) {
      case EnginePhase::Fresh:
        return "Fresh";
      case EnginePhase::Restored:
        return "Restored";
      case EnginePhase::Running:
        return "Running";
      case EnginePhase::Completed:
        return "Completed";
      case EnginePhase::Failed:
        return "Failed";
      default:
        return "Unknown";
      }
    }

    /**
 * @class Engine
 * @brief Owns the current Checkpoint and the store it is persisted to.
 *
 *  * `State` needs `std::optional<State> transition() &&` (throwing on failure)
 *    and a lossless JSON encoding (see core::Machine).
 *  * Every transition attempt ends in exactly one `save()`; completion ends in
 *    exactly one `clean()`.
 *  * A failed step is sticky: `run()` refuses to start again until
 *    `dropError()` is called.
 *  * Single-threaded; the store location is assumed to have one writer.
 */
    template <typename State> class Engine {
    public:
      using Phase = EnginePhase;

      /// No I/O happens here; call restore() to pick up a previous run.
      Engine(State initial, std::shared_ptr<io::CheckpointStore> store,
             std::shared_ptr<Logger> logger = nullptr);

      //---public API------------------------------------------------------
      /** Replaces the in-memory checkpoint with the stored one, if any. */
      Engine& restore();

      /** Acknowledges a previous failure and persists the cleared checkpoint. */
      void dropError();

      /**
       * Runs steps until one returns std::nullopt (record removed) or throws.
       * After a failed clean() a further call only retries the removal.
       * @throws PendingStepError  an earlier failure has not been acknowledged.
       * @throws StepError         a step failed; the checkpoint is rolled back and saved.
       * @throws StoreError        persistence broke; nothing is guaranteed to have landed.
       */
      void run();

      const Checkpoint<State>& checkpoint() const { return checkpoint_; }
      Phase phase() const { return phase_; }
      bool hasPendingError() const { return checkpoint_.error.has_value(); }
      const io::CheckpointStore& store() const { return *store_; }

    private:
      void save();
      nlohmann::json encodeState(const State& state) const;
      State decodeState(const nlohmann::json& snapshot) const;
      std::string describe(const State& state) const;

      // Runs a store call, reporting anything that is not already a StoreError as one.
      template <typename Fn> auto callStore(const char* op, Fn&& fn);
      void finish();

      std::shared_ptr<io::CheckpointStore> store_;
      std::shared_ptr<Logger> logger_;
      Checkpoint<State> checkpoint_;
      Phase phase_{ Phase::Fresh };
      bool cleanPending_{ false }; ///< last step returned nullopt but clean() has not landed
    };

    //---implementation---------------------------------------------------

    template <typename State>
    Engine<State>::Engine(State initial, std::shared_ptr<io::CheckpointStore> store,
                          std::shared_ptr<Logger> logger)
        : store_(std::move(store)), logger_(std::move(logger)),
          checkpoint_{ std::move(initial) } {
      if (!store_)
        throw std::invalid_argument("[Engine] checkpoint store is nullptr");
      if (!logger_)
        logger_ = std::make_shared<Logger>(LogLevel::Warn, &std::clog);
    }

    template <typename State> Engine<State>& Engine<State>::restore() {
      auto record = callStore("load", [this] { return store_->load(); });
      if (!record) {
        logger_->debug("Nothing to restore at " + store_->location());
        if (phase_ == Phase::Fresh)
          phase_ = Phase::Restored;
        return *this;
      }

      try {
        checkpoint_ = Checkpoint<State>::fromJson(*record);
      } catch (const std::exception&) {
        std::throw_with_nested(
            StoreError("[Engine] can't decode checkpoint from " + store_->location()));
      }

      phase_ = checkpoint_.error ? Phase::Failed : Phase::Restored;
      logger_->info("Restored step: " + describe(checkpoint_.state));
      return *this;
    }

    template <typename State> void Engine<State>::dropError() {
      if (checkpoint_.error)
        logger_->info("Dropping previous error: " + *checkpoint_.error);
      checkpoint_.error.reset();
      save();
      if (phase_ == Phase::Failed)
        phase_ = Phase::Restored;
    }

    template <typename State> void Engine<State>::run() {
      if (phase_ == Phase::Completed)
        throw std::logic_error("[Engine] run() called after the machine completed");

      // the terminal step already ran; only the record removal is left to do
      if (cleanPending_) {
        finish();
        return;
      }

      if (checkpoint_.error) {
        std::string message = "Previous run resulted in an error: " + *checkpoint_.error +
                              " on step: " + describe(checkpoint_.state);
        logger_->warn(message);
        phase_ = Phase::Failed;
        throw PendingStepError(message);
      }

      phase_ = Phase::Running;
      for (;;) {
        if (logger_->enabled(LogLevel::Info))
          logger_->info("Running step: " + describe(checkpoint_.state));
        const nlohmann::json snapshot = encodeState(checkpoint_.state);

        std::optional<State> next;
        try {
          next = std::move(checkpoint_.state).transition();
        } catch (...) {
          std::string failure = formatErrorChain(std::current_exception());
          // the failed attempt may have consumed the state; take it back from the snapshot
          checkpoint_.state = decodeState(snapshot);
          checkpoint_.error = failure;
          phase_ = Phase::Failed;
          logger_->error("Step failed: " + failure);
          save();
          throw StepError(failure);
        }

        if (!next) {
          cleanPending_ = true;
          finish();
          return;
        }

        checkpoint_.state = std::move(*next);
        save();
      }
    }

    template <typename State> void Engine<State>::finish() {
      callStore("clean", [this] { store_->clean(); });
      cleanPending_ = false;
      phase_ = Phase::Completed;
      logger_->info("Finished successfully");
    }

    template <typename State> void Engine<State>::save() {
      nlohmann::json record;
      try {
        record = checkpoint_.toJson();
      } catch (const std::exception&) {
        std::throw_with_nested(StoreError("[Engine] can't encode checkpoint: " +
                                          describe(checkpoint_.state)));
      }
      callStore("save", [this, &record] { store_->save(record); });
      logger_->debug("Saved checkpoint to " + store_->location());
    }

    template <typename State>
    nlohmann::json Engine<State>::encodeState(const State& state) const {
      try {
        return nlohmann::json(state);
      } catch (const std::exception&) {
        std::throw_with_nested(StoreError("[Engine] can't encode state snapshot"));
      }
    }

    template <typename State>
    State Engine<State>::decodeState(const nlohmann::json& snapshot) const {
      try {
        return snapshot.get<State>();
      } catch (const std::exception&) {
        std::throw_with_nested(StoreError("[Engine] can't decode state snapshot: " +
                                          snapshot.dump()));
      }
    }

    template <typename State> std::string Engine<State>::describe(const State& state) const {
      try {
        return nlohmann::json(state).dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace);
      } catch (const nlohmann::json::exception& e) {
        return std::string("<unprintable state: ") + e.what() + ">";
      }
    }

    template <typename State>
    template <typename Fn>
    auto Engine<State>::callStore(const char* op, Fn&& fn) {
      try {
        return fn();
      } catch (const StoreError&) {
        throw;
      } catch (const std::exception&) {
        std::throw_with_nested(StoreError(std::string("[Engine] store ") + op + " failed at " +
                                          store_->location()));
      }
    }

  } // namespace core
} // namespace stepwise
