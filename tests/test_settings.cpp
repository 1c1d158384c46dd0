#include "cifra/pipeline.h"
#include "cifra/settings.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace cifra;

namespace {

ResolverSettings parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static char program[] = "cifra_cli";
    argv.push_back(program);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

std::string settings_path() {
    return std::string(CIFRA_TEST_DATA_DIR) + "/settings.xml";
}

} // namespace

TEST(SettingsTest, ParseArguments) {
    ResolverSettings settings = parse({"--input=doc.json", "--verbose", "stray", "--acceptance_threshold=0.8",
                                       "--escalation-response=answer.json", "--format=report"});
    EXPECT_EQ(settings.input_file, "doc.json");
    EXPECT_TRUE(settings.verbose);
    EXPECT_FALSE(settings.debug);
    EXPECT_FALSE(settings.strict);
    EXPECT_EQ(settings.escalation_response_file, "answer.json");
    EXPECT_EQ(settings.get("format"), "report");
    EXPECT_EQ(settings.get("missing", "toon"), "toon");
    EXPECT_DOUBLE_EQ(settings.get_double("acceptance_threshold", 0.75), 0.8);
    EXPECT_EQ(settings.get_int("escalation_timeout_ms", 30000), 30000);
    EXPECT_EQ(settings.options.count("stray"), 0u);
}

TEST(SettingsTest, BadNumbersThrow) {
    ResolverSettings settings = parse({"--acceptance_threshold=high", "--escalation_timeout_ms=soon"});
    EXPECT_THROW(settings.get_double("acceptance_threshold", 0.75), std::invalid_argument);
    EXPECT_THROW(settings.get_int("escalation_timeout_ms", 30000), std::invalid_argument);

    ResolutionPipeline pipeline;
    EXPECT_THROW(pipeline.configure(settings), std::invalid_argument);
}

TEST(SettingsTest, Booleans) {
    ResolverSettings settings = parse({"--strict=yes", "--debug=0"});
    EXPECT_TRUE(settings.strict);
    EXPECT_FALSE(settings.debug);
    EXPECT_TRUE(settings.get_bool("strict", false));
    EXPECT_TRUE(settings.get_bool("absent", true));
}

TEST(SettingsTest, FirstProfileByDefault) {
    ResolverSettings settings = load_settings(parse({"--settings=" + settings_path()}));
    EXPECT_EQ(settings.get("format"), "toon");
    EXPECT_DOUBLE_EQ(settings.get_double("acceptance_threshold", 0.0), 0.75);
    EXPECT_FALSE(settings.strict);
    EXPECT_EQ(settings.options.count("pid"), 0u);
}

TEST(SettingsTest, NamedProfileUnderCommandLine) {
    ResolverSettings settings = load_settings(
        parse({"--settings=" + settings_path(), "--profile=strict", "--format=json", "--input=doc.json"}));
    EXPECT_EQ(settings.get("format"), "json");
    EXPECT_EQ(settings.input_file, "doc.json");
    EXPECT_TRUE(settings.strict);
    EXPECT_TRUE(settings.verbose);
    EXPECT_EQ(settings.get_int("escalation_timeout_ms", 0), 5000);

    ResolutionPipeline pipeline;
    pipeline.configure(settings);
    EXPECT_DOUBLE_EQ(pipeline.options().acceptance_threshold, 0.9);
    EXPECT_DOUBLE_EQ(pipeline.options().policy.fuzzy_priority_cap, 0.8);
    EXPECT_DOUBLE_EQ(pipeline.options().policy.fuzzy_match_cap, 0.95);
    EXPECT_EQ(pipeline.options().escalation_timeout, std::chrono::milliseconds(5000));
    EXPECT_TRUE(pipeline.options().verbose);
}

TEST(SettingsTest, MissingProfileOrFile) {
    EXPECT_THROW(load_settings(parse({"--settings=" + settings_path(), "--profile=nightly"})), std::runtime_error);
    EXPECT_THROW(load_settings(parse({"--settings=" + std::string(CIFRA_TEST_DATA_DIR) + "/nope.xml"})),
                 std::runtime_error);
}
