#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include "core/errors.hpp"
#include <sstream>

using namespace ag;

class CommandLineTest : public ::testing::Test {
protected:
    Subcommand render{
        "render",
        "Render the network",
        {
            {"mode", "m", "3d or 2d", "3d", false, false},
            {"hide", "", "Types to hide", "", false, false},
            {"json", "j", "JSON output", "", false, true},
            {"price", "", "Price", "", false, false}
        },
        [](const ParsedArgs&) { return 0; }
    };
};

// ==========================================
// Parsing Tests
// ==========================================

TEST_F(CommandLineTest, DefaultsApplied) {
    auto args = CommandLine::parse(render, {});
    EXPECT_EQ(args.get("mode").str(), "3d");
    EXPECT_FALSE(args.has("json"));
}

TEST_F(CommandLineTest, LongShortAndInlineForms) {
    auto args = CommandLine::parse(render, {"-m", "2d", "--hide=same_sector, event_impact", "-j"});
    EXPECT_EQ(args.get("mode").str(), "2d");
    EXPECT_TRUE(args.has("json"));
    EXPECT_EQ(args.get("hide").to_list(), (std::vector<std::string>{"same_sector", "event_impact"}));
}

TEST_F(CommandLineTest, FlagWithFalseInlineValueIsUnset) {
    auto args = CommandLine::parse(render, {"--json=false"});
    EXPECT_FALSE(args.has("json"));
}

TEST_F(CommandLineTest, PositionalsCollected) {
    auto args = CommandLine::parse(render, {"input.json", "--json", "extra"});
    EXPECT_EQ(args.positional(), (std::vector<std::string>{"input.json", "extra"}));
}

TEST_F(CommandLineTest, UnknownOptionRejected) {
    EXPECT_THROW(CommandLine::parse(render, {"--colour", "red"}), UsageError);
}

TEST_F(CommandLineTest, MissingValueRejected) {
    EXPECT_THROW(CommandLine::parse(render, {"--mode"}), UsageError);
}

TEST_F(CommandLineTest, RequiredOptionEnforced) {
    render.options.push_back({"id", "", "Asset id", "", true, false});
    EXPECT_THROW(CommandLine::parse(render, {}), UsageError);
    EXPECT_EQ(CommandLine::parse(render, {"--id", "AAPL"}).require("id"), "AAPL");
}

// ==========================================
// Value Conversion Tests
// ==========================================

TEST_F(CommandLineTest, StrictNumbers) {
    auto args = CommandLine::parse(render, {"--price", "12.5"});
    EXPECT_DOUBLE_EQ(args.get("price").to_double(), 12.5);

    auto bad = CommandLine::parse(render, {"--price", "12abc"});
    EXPECT_THROW(bad.get("price").to_double(), UsageError);
    EXPECT_THROW(bad.get("price").to_int(), UsageError);
}

TEST(OptionValueTest, FallbacksWhenAbsent) {
    OptionValue value;
    EXPECT_EQ(value.to_int(7), 7);
    EXPECT_DOUBLE_EQ(value.to_double(1.5), 1.5);
    EXPECT_TRUE(value.to_bool(true));
    EXPECT_TRUE(value.to_list().empty());
    EXPECT_FALSE(static_cast<bool>(value));
}

TEST(OptionValueTest, BoolSpellings) {
    EXPECT_TRUE((OptionValue{"v", "yes", true}).to_bool());
    EXPECT_TRUE((OptionValue{"v", "on", true}).to_bool());
    EXPECT_FALSE((OptionValue{"v", "no", true}).to_bool(true));
}

// ==========================================
// Dispatch Tests
// ==========================================

TEST(CommandLineDispatchTest, SharedOptionsAppendedToCommands) {
    CommandLine cli("assetgraph", "1.0.0");
    cli.add_shared_options({{"verbose", "V", "Verbose", "", false, true}});

    bool verbose_seen = false;
    cli.add({"metrics", "Compute metrics", {}, [&verbose_seen](const ParsedArgs& args) {
        verbose_seen = args.has("verbose");
        return 0;
    }});

    std::vector<std::string> storage{"assetgraph", "metrics", "-V"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(&s[0]);

    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 0);
    EXPECT_TRUE(verbose_seen);
}

TEST(CommandLineDispatchTest, ExitCodes) {
    CommandLine cli("assetgraph", "1.0.0");
    cli.add({"fail", "Always fails", {}, [](const ParsedArgs&) -> int {
        throw std::runtime_error("boom");
    }});

    std::vector<std::string> unknown{"assetgraph", "nope"};
    std::vector<std::string> failing{"assetgraph", "fail"};
    std::vector<std::string> bad_option{"assetgraph", "fail", "--what"};

    auto run = [&cli](std::vector<std::string>& storage) {
        std::vector<char*> argv;
        for (auto& s : storage) argv.push_back(&s[0]);
        return cli.run(static_cast<int>(argv.size()), argv.data());
    };

    EXPECT_EQ(run(unknown), 2);
    EXPECT_EQ(run(failing), 1);
    EXPECT_EQ(run(bad_option), 2);
}

TEST(CommandLineDispatchTest, UsageListsCommandsInOrder) {
    CommandLine cli("assetgraph", "1.0.0");
    cli.add({"build", "Build", {}, [](const ParsedArgs&) { return 0; }})
       .add({"add-equity", "Add", {}, [](const ParsedArgs&) { return 0; }});

    std::ostringstream out;
    cli.print_usage(out);
    const std::string text = out.str();
    EXPECT_LT(text.find("build"), text.find("add-equity"));
}
