#include <fcomb-test/util.h>

#include <fcomb/base/message_sinks.h>

#include <fcomb/summary.h>

#include <chrono>

using namespace fcomb;

namespace
{
    RunOutcome make_outcome(StringView package_name,
                            FeatureSet features,
                            Optional<int> exit_code,
                            Optional<size_t> warnings,
                            Optional<size_t> errors)
    {
        RunOutcome outcome;
        outcome.package_name = package_name.to_string();
        outcome.features = std::move(features);
        outcome.exit_code = exit_code;
        outcome.warnings = warnings;
        outcome.errors = errors;
        outcome.pedantic_success = is_pedantic_success(exit_code == 0, warnings, errors, false);
        return outcome;
    }
}

TEST_CASE ("pedantic success", "[summary]")
{
    CHECK(is_pedantic_success(true, size_t{0}, size_t{0}, false));
    CHECK(is_pedantic_success(true, size_t{3}, size_t{0}, false));
    CHECK_FALSE(is_pedantic_success(false, size_t{0}, size_t{0}, false));
    CHECK(is_pedantic_success(true, size_t{0}, size_t{0}, true));
    CHECK_FALSE(is_pedantic_success(true, size_t{3}, size_t{0}, true));
    CHECK_FALSE(is_pedantic_success(true, size_t{0}, size_t{1}, true));
    CHECK(is_pedantic_success(true, nullopt, nullopt, true));
}

TEST_CASE ("format status", "[summary]")
{
    CHECK(format_status(LocalizedString::from_raw("Finished")) == "    Finished ");
    CHECK(format_status(LocalizedString::from_raw("FAIL")) == "        FAIL ");
}

TEST_CASE ("summary exit code", "[summary]")
{
    std::vector<RunOutcome> outcomes;
    CHECK(summary_exit_code(outcomes) == 0);

    outcomes.push_back(make_outcome("app", {}, 0, size_t{2}, size_t{0}));
    CHECK(summary_exit_code(outcomes) == 0);

    outcomes.push_back(make_outcome("app", {"std"}, 101, size_t{0}, size_t{1}));
    outcomes.push_back(make_outcome("app", {"alloc"}, 2, size_t{0}, size_t{1}));
    CHECK(summary_exit_code(outcomes) == 101);

    SECTION ("killed")
    {
        outcomes.insert(outcomes.begin(), make_outcome("app", {"nightly"}, nullopt, nullopt, nullopt));
        CHECK(summary_exit_code(outcomes) == 1);
    }

    SECTION ("pedantic failure of a successful build")
    {
        auto pedantic = make_outcome("app", {"tls"}, 0, size_t{4}, size_t{0});
        pedantic.pedantic_success = false;
        outcomes.insert(outcomes.begin(), std::move(pedantic));
        CHECK(summary_exit_code(outcomes) == 1);
    }
}

TEST_CASE ("print summary", "[summary]")
{
    std::vector<RunOutcome> outcomes;
    outcomes.push_back(make_outcome("app", {}, 0, size_t{0}, size_t{0}));
    outcomes.push_back(make_outcome("app", {"std"}, 0, size_t{12}, size_t{0}));
    outcomes.push_back(make_outcome("core", {"a", "b"}, 101, nullopt, nullopt));

    BufferedMessageSink sink;
    const auto exit_code = print_summary(sink, outcomes, ElapsedTime{std::chrono::milliseconds{3532}});
    CHECK(exit_code == 101);
    CHECK(sink.to_string() == "\n"
                              "    Finished 3 total feature combinations for 2 packages in 3.532s\n"
                              "\n"
                              "        PASS app ( 0 errors, 00 warnings, features = [] )\n"
                              "        WARN app ( 0 errors, 12 warnings, features = [std] )\n"
                              "        FAIL core ( ? errors,  ? warnings, features = [a, b] )\n"
                              "\n");
}

TEST_CASE ("print summary of a single combination", "[summary]")
{
    std::vector<RunOutcome> outcomes;
    outcomes.push_back(make_outcome("app", {"std"}, 0, size_t{0}, size_t{0}));

    BufferedMessageSink sink;
    CHECK(print_summary(sink, outcomes, ElapsedTime{std::chrono::seconds{61}}) == 0);
    REQUIRE(sink.lines().size() == 5);
    CHECK(sink.lines()[1].to_string() == "    Finished 1 total feature combination for 1 package in 1m1.000s");
}

TEST_CASE ("counts are zero padded to the widest count", "[summary]")
{
    std::vector<RunOutcome> outcomes;
    outcomes.push_back(make_outcome("app", {}, 101, size_t{7}, size_t{120}));
    outcomes.push_back(make_outcome("app", {"std"}, 0, size_t{15}, size_t{0}));
    outcomes.push_back(make_outcome("app", {"alloc"}, 101, nullopt, nullopt));

    BufferedMessageSink sink;
    CHECK(print_summary(sink, outcomes, ElapsedTime{}) == 101);
    REQUIRE(sink.lines().size() == 7);
    CHECK(sink.lines()[3].to_string() == "        FAIL app ( 120 errors, 07 warnings, features = [] )");
    CHECK(sink.lines()[4].to_string() == "        WARN app ( 000 errors, 15 warnings, features = [std] )");
    CHECK(sink.lines()[5].to_string() == "        FAIL app (   ? errors,  ? warnings, features = [alloc] )");
}
