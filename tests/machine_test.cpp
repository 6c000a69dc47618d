// Stepwise-Prod headers
#include "core/Checkpoint.hpp"
#include "core/Machine.hpp"
#include "steps/CoinSteps.hpp"
#include "steps/InboxSteps.hpp"

// Stepwise-Fake headers
#include "CounterSteps.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace stepwise::test {

  using stepwise::core::Checkpoint;
  using stepwise::steps::CheckInbox;
  using stepwise::steps::Coin;
  using stepwise::steps::CoinMachine;
  using stepwise::steps::CountFiles;
  using stepwise::steps::FirstToss;
  using stepwise::steps::InboxMachine;
  using stepwise::steps::SecondToss;
  using stepwise::steps::WriteReport;

  TEST(machine, encodes_active_step_under_its_name) {
    CoinMachine first = FirstToss{};
    CoinMachine second = SecondToss{ Coin::Tails };

    EXPECT_EQ(first.toJson(), nlohmann::json::parse(R"({"FirstToss": {}})"));
    EXPECT_EQ(nlohmann::json(second),
              nlohmann::json::parse(R"({"SecondToss": {"first_coin": "Tails"}})"));
    EXPECT_EQ(first.name(), "FirstToss");
    EXPECT_EQ(second.name(), "SecondToss");
  }

  TEST(machine, decodes_variant_from_tag_alone) {
    auto m = nlohmann::json::parse(R"({"SecondToss": {"first_coin": "Heads"}})").get<CoinMachine>();

    ASSERT_TRUE(m.holds<SecondToss>());
    EXPECT_EQ(m.get<SecondToss>().firstCoin, Coin::Heads);
  }

  TEST(machine, decoded_steps_behave_like_the_originals) {
    StepProbe::reset();
    CoinMachine original = SecondToss{ Coin::Heads };
    EXPECT_EQ(CoinMachine::fromJson(original.toJson()), original);

    InboxMachine report = WriteReport{ "/srv/inbox", 7 };
    EXPECT_EQ(InboxMachine::fromJson(report.toJson()), report);
    EXPECT_EQ(InboxMachine::fromJson(InboxMachine(CountFiles{ "a" }).toJson()),
              InboxMachine(CountFiles{ "a" }));

    // same next state from the original and from its decoded copy
    CounterMachine counter = Counter{ 4, 9 };
    CounterMachine copy = CounterMachine::fromJson(counter.toJson());
    auto a = std::move(counter).transition();
    auto b = std::move(copy).transition();
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(*a, CounterMachine(Counter{ 5, 9 }));
    StepProbe::reset();
  }

  TEST(machine, rejects_unknown_or_malformed_records) {
    EXPECT_THROW(CoinMachine::fromJson(nlohmann::json::parse(R"({"ThirdToss": {}})")),
                 std::invalid_argument);
    EXPECT_THROW(CoinMachine::fromJson(nlohmann::json::parse(R"("FirstToss")")),
                 std::invalid_argument);
    EXPECT_THROW(
        CoinMachine::fromJson(nlohmann::json::parse(R"({"FirstToss": {}, "SecondToss": {}})")),
        std::invalid_argument);
    EXPECT_THROW(
        CoinMachine::fromJson(nlohmann::json::parse(R"({"SecondToss": {"first_coin": "Edge"}})")),
        std::invalid_argument);
    EXPECT_THROW(CoinMachine::fromJson(nlohmann::json::parse(R"({"SecondToss": {}})")),
                 nlohmann::json::out_of_range);
  }

  TEST(machine, transition_dispatches_to_active_step) {
    StepProbe::reset();
    CounterMachine last = Counter{ 2, 3 };
    auto next = std::move(last).transition();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(next->holds<Finish>());
    EXPECT_EQ(next->get<Finish>().total, 3);

    auto done = std::move(*next).transition();
    EXPECT_FALSE(done.has_value());
    EXPECT_EQ(StepProbe::finishes, 1);
    StepProbe::reset();
  }

  TEST(checkpoint, json_form_has_state_and_nullable_error) {
    Checkpoint<InboxMachine> clean{ CheckInbox{ "in" } };
    EXPECT_EQ(clean.toJson(),
              nlohmann::json::parse(R"({"state": {"CheckInbox": {"dir": "in"}}, "error": null})"));

    Checkpoint<InboxMachine> failed{ CheckInbox{ "in" }, "inbox `in` is missing" };
    auto decoded = Checkpoint<InboxMachine>::fromJson(failed.toJson());
    EXPECT_EQ(decoded.state, failed.state);
    EXPECT_EQ(decoded.error, failed.error);
  }

  TEST(checkpoint, missing_error_key_means_no_error) {
    auto decoded = Checkpoint<CoinMachine>::fromJson(
        nlohmann::json::parse(R"({"state": {"FirstToss": {}}})"));
    EXPECT_TRUE(decoded.state.holds<FirstToss>());
    EXPECT_FALSE(decoded.error.has_value());
  }

  TEST(checkpoint, missing_state_is_rejected) {
    EXPECT_THROW(Checkpoint<CoinMachine>::fromJson(nlohmann::json::parse(R"({"error": null})")),
                 nlohmann::json::out_of_range);
  }

} // namespace stepwise::test
