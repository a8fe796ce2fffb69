#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include "core/errors.hpp"

using namespace lpi;

class CliParseTest : public ::testing::Test {
protected:
    Command analyze{
        "analyze",
        "Analyze entries",
        {
            {"input", "i", "Entries JSON", "", true, false},
            {"output", "o", "Results JSON", "output/results.json", false, false},
            {"k", "k", "Number of themes", "", false, false},
            {"periods", "p", "Cycle periods", "", false, false},
            {"metric", "m", "Distance metric", "", false, false, {"euclidean", "cosine"}},
            {"verbose", "v", "Verbose output", "", false, true}
        },
        [](const Args&) { return 0; }
    };
};

TEST_F(CliParseTest, LongShortAndInlineForms) {
    Args args = CLI::parse_args(analyze, {"--input", "days.json", "-k", "4", "--metric=cosine", "-v"});
    EXPECT_EQ(args.require("input"), "days.json");
    EXPECT_EQ(args.get("k").as_int(), 4);
    EXPECT_EQ(args.get("metric").value, "cosine");
    EXPECT_TRUE(args.has("verbose"));
}

TEST_F(CliParseTest, DefaultsApplied) {
    Args args = CLI::parse_args(analyze, {"-i", "days.json"});
    EXPECT_EQ(args.get("output").value, "output/results.json");
    EXPECT_FALSE(args.has("k"));
    EXPECT_EQ(args.get("k").as_int(5), 5);
}

TEST_F(CliParseTest, IntegerLists) {
    Args args = CLI::parse_args(analyze, {"-i", "x", "--periods", "7,14,,30"});
    EXPECT_EQ(args.get("periods").as_int_list(), (std::vector<int>{7, 14, 30}));
}

TEST_F(CliParseTest, RejectsBadArguments) {
    EXPECT_THROW(CLI::parse_args(analyze, {}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze, {"-i", "x", "--unknown", "1"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze, {"-i"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze, {"-i", "x", "--metric", "manhattan"}), std::runtime_error);
    EXPECT_THROW(CLI::parse_args(analyze, {"-i", "x", "--verbose=yes"}), std::runtime_error);
}

TEST_F(CliParseTest, MalformedNumbersThrow) {
    Args args = CLI::parse_args(analyze, {"-i", "x", "-k", "4x"});
    EXPECT_THROW(args.get("k").as_int(), std::runtime_error);
    EXPECT_THROW((ArgValue{"abc", true}.as_double()), std::runtime_error);
    EXPECT_DOUBLE_EQ((ArgValue{"0.25", true}.as_double()), 0.25);
}

TEST_F(CliParseTest, OversizedIntegerNamesField) {
    Args args = CLI::parse_args(analyze, {"-i", "x", "-k", "4294967300"});
    try {
        args.get("k").as_int_in_range("k");
        FAIL() << "expected InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_EQ(e.field(), "k");
    }
    EXPECT_EQ((ArgValue{"-2", true}.as_int_in_range("week_window")), -2);
    EXPECT_THROW((ArgValue{"9", true}.as_int_in_range("anomaly_top_n", 0, 5)), InvalidConfigurationError);
    EXPECT_THROW((ArgValue{"7,4294967300", true}.as_int_list()), std::runtime_error);
}

TEST_F(CliParseTest, RunDispatchesAndMapsExitCodes) {
    CLI cli("lpi", "test");
    int seen_k = 0;
    cli.register_command({
        "analyze", "Analyze entries",
        {{"k", "k", "Number of themes", "", true, false}},
        [&](const Args& args) {
            seen_k = static_cast<int>(args.get("k").as_int());
            return kExitOk;
        }
    });

    char prog[] = "lpi";
    char cmd[] = "analyze";
    char flag[] = "-k";
    char value[] = "3";
    char* ok_argv[] = {prog, cmd, flag, value};
    EXPECT_EQ(cli.run(4, ok_argv), kExitOk);
    EXPECT_EQ(seen_k, 3);

    char* missing_argv[] = {prog, cmd};
    EXPECT_EQ(cli.run(2, missing_argv), kExitUsage);

    char unknown[] = "explode";
    char* unknown_argv[] = {prog, unknown};
    EXPECT_EQ(cli.run(2, unknown_argv), kExitUsage);
}
