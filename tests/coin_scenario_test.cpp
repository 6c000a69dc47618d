// Stepwise-Prod headers
#include "core/Engine.hpp"
#include "core/Launcher.hpp"
#include "io/JsonFileStore.hpp"
#include "steps/CoinSteps.hpp"

// Stepwise-Fake headers
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <deque>
#include <fstream>
#include <sstream>

namespace stepwise::test {

  using stepwise::core::Engine;
  using stepwise::core::LogLevel;
  using stepwise::core::Logger;
  using stepwise::core::PendingStepError;
  using stepwise::core::StepError;
  using stepwise::io::JsonFileStore;
  using stepwise::steps::Coin;
  using stepwise::steps::CoinMachine;
  using stepwise::steps::FirstToss;
  using stepwise::steps::SecondToss;

  // Feeds scripted tosses to the coin steps and counts them.
  class CoinScenarioTest : public ::testing::Test {
  protected:
    void SetUp() override {
      stepwise::steps::setCoinSource([this] {
        ++tosses;
        if (script.empty())
          throw std::logic_error("coin script exhausted");
        Coin c = script.front();
        script.pop_front();
        return c;
      });
    }
    void TearDown() override { stepwise::steps::setCoinSource(nullptr); }

    Engine<CoinMachine> relaunch() {
      Engine<CoinMachine> engine(FirstToss{}, std::make_shared<JsonFileStore>(file),
                                 std::make_shared<Logger>(LogLevel::Off));
      engine.restore();
      return engine;
    }

    TempDir dir;
    std::filesystem::path file = dir / "coin.json";
    std::deque<Coin> script;
    int tosses = 0;
  };

  TEST_F(CoinScenarioTest, mismatch_blocks_until_acknowledged_then_resumes_at_second_toss) {
    // run 1: Heads then Tails
    script = { Coin::Heads, Coin::Tails };
    {
      auto engine = relaunch();
      try {
        engine.run();
        FAIL() << "expected StepError";
      } catch (const StepError& e) {
        EXPECT_STREQ(e.what(), "Coins landed differently");
      }
    }
    EXPECT_EQ(tosses, 2);
    EXPECT_EQ(*JsonFileStore(file).load(), nlohmann::json::parse(R"({
      "state": {"SecondToss": {"first_coin": "Heads"}},
      "error": "Coins landed differently"
    })"));

    // run 2: no acknowledgement, no toss
    {
      auto engine = relaunch();
      EXPECT_TRUE(engine.checkpoint().state.holds<SecondToss>());
      EXPECT_THROW(engine.run(), PendingStepError);
    }
    EXPECT_EQ(tosses, 2);

    // run 3: acknowledged, second toss is retried and matches
    script = { Coin::Heads };
    {
      auto engine = relaunch();
      engine.dropError();
      engine.run();
    }
    EXPECT_EQ(tosses, 3);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_FALSE(JsonFileStore(file).load().has_value());
  }

  TEST_F(CoinScenarioTest, matching_coins_finish_in_one_run) {
    script = { Coin::Tails, Coin::Tails };
    auto engine = relaunch();
    engine.run();

    EXPECT_EQ(tosses, 2);
    EXPECT_FALSE(std::filesystem::exists(file));
  }

  TEST_F(CoinScenarioTest, launch_reports_exit_codes_across_relaunches) {
    stepwise::core::RunOptions options;
    options.storePath = file;
    std::ostringstream err;

    script = { Coin::Tails, Coin::Heads };
    EXPECT_EQ(stepwise::core::launch<CoinMachine>(FirstToss{}, options, err),
              stepwise::core::kExitStepFailed);
    EXPECT_EQ(err.str(), "Error: Coins landed differently\n");

    err.str("");
    EXPECT_EQ(stepwise::core::launch<CoinMachine>(FirstToss{}, options, err),
              stepwise::core::kExitStepFailed);
    EXPECT_NE(err.str().find("Previous run resulted in an error"), std::string::npos);
    EXPECT_EQ(tosses, 2);

    options.acknowledge = true;
    script = { Coin::Tails };
    EXPECT_EQ(stepwise::core::launch<CoinMachine>(FirstToss{}, options, err),
              stepwise::core::kExitOk);
    EXPECT_EQ(tosses, 3);
  }

  TEST_F(CoinScenarioTest, launch_reports_corrupt_checkpoint_as_setup_failure) {
    std::ofstream(file) << "]";
    stepwise::core::RunOptions options;
    options.storePath = file;
    std::ostringstream err;

    EXPECT_EQ(stepwise::core::launch<CoinMachine>(FirstToss{}, options, err),
              stepwise::core::kExitSetupFailed);
    EXPECT_EQ(err.str().rfind("Error: can't decode json: ]", 0), 0u);
    EXPECT_EQ(tosses, 0);
  }

} // namespace stepwise::test
