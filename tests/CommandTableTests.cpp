// CommandTableTests.cpp
// Logical command lookup and protocol argument encoding.

#include <gtest/gtest.h>
#include "command_table.h"

namespace {

ApiCall build(const std::string& command, const std::string& value) {
    const CommandSpec* spec = findCommand(command);
    EXPECT_NE(spec, nullptr) << command;
    ApiCall call;
    if (spec) {
        WamError err = buildApiCall(*spec, value, call);
        EXPECT_TRUE(err.ok()) << err.cause;
    }
    return call;
}

} // namespace

TEST(CommandTableTests, EveryCommandUsesUicWithoutPowerRequirement) {
    for (const CommandSpec& spec : commandTable()) {
        EXPECT_STREQ(spec.apiType, "UIC") << spec.logicalName;
        EXPECT_STREQ(spec.expectedResponseTag, "") << spec.logicalName;
        EXPECT_FALSE(spec.requiresPower) << spec.logicalName;
    }
    EXPECT_EQ(commandTable().size(), 11u);
}

TEST(CommandTableTests, UnknownCommandNotFound) {
    EXPECT_EQ(findCommand("shuffle"), nullptr);
    EXPECT_EQ(findCommand("VOLUME"), nullptr);
}

TEST(CommandTableTests, VolumeEncodesDecimal) {
    ApiCall call = build("volume", "15");
    EXPECT_EQ(call.apiType, "UIC");
    EXPECT_EQ(call.method, "SetVolume");
    ASSERT_EQ(call.args.size(), 1u);
    EXPECT_EQ(call.args[0].name, "nVolume");
    EXPECT_EQ(call.args[0].value, "15");
    EXPECT_EQ(call.args[0].type, "dec");
    EXPECT_FALSE(call.userCheck);
    EXPECT_EQ(call.timeoutMultiple, 1);
}

TEST(CommandTableTests, DefaultsApplyWhenValueEmpty) {
    EXPECT_EQ(build("volume", "").args[0].value, "10");
    EXPECT_EQ(build("power", "").args[0].value, "on");
    EXPECT_EQ(build("mute", "").args[0].value, "on");

    ApiCall input = build("set_input", "");
    EXPECT_EQ(input.method, "SetInput");
    EXPECT_EQ(input.args[0].name, "strSource");
    EXPECT_EQ(input.args[0].value, "BT");
    EXPECT_EQ(input.args[0].type, "str");
}

TEST(CommandTableTests, TransportCommandsHaveNoArguments) {
    const char* names[] = {"play", "pause", "stop", "next", "prev"};
    const char* methods[] = {"Play", "Pause", "Stop", "Next", "Prev"};
    for (int i = 0; i < 5; i++) {
        ApiCall call = build(names[i], "ignored");
        EXPECT_EQ(call.method, methods[i]);
        EXPECT_TRUE(call.args.empty());
    }
}

TEST(CommandTableTests, NonNumericVolumeRejected) {
    ApiCall call;
    WamError err = buildApiCall(*findCommand("volume"), "loud", call);
    EXPECT_EQ(err.code, WamErrorCode::InvalidArgument);
}

//==============================================================================
// EQ presets
//==============================================================================

TEST(CommandTableTests, EqPresetNameMapsToIndex) {
    ApiCall call = build("set_eq_preset", "Jazz");
    EXPECT_EQ(call.method, "Set7bandEQMode");
    ASSERT_EQ(call.args.size(), 1u);
    EXPECT_EQ(call.args[0].name, "presetindex");
    EXPECT_EQ(call.args[0].value, "2");
    EXPECT_EQ(call.args[0].type, "dec");

    EXPECT_EQ(build("set_eq_preset", "Bass Boost").args[0].value, "5");
    EXPECT_EQ(build("set_eq_preset", "Voice").args[0].value, "8");
}

TEST(CommandTableTests, UnknownEqPresetFallsBackToNormal) {
    bool found = true;
    EXPECT_EQ(eqPresetIndex("Disco", &found), 0);
    EXPECT_FALSE(found);
    EXPECT_EQ(build("set_eq_preset", "Disco").args[0].value, "0");
}

TEST(CommandTableTests, EqValuesEncodesEightArguments) {
    ApiCall call = build("set_eq_values", "1, -3,0,2,4,6,-6,1");
    EXPECT_EQ(call.method, "Set7bandEQValue");
    ASSERT_EQ(call.args.size(), 8u);
    EXPECT_EQ(call.args[0].name, "presetindex");
    EXPECT_EQ(call.args[0].value, "1");
    EXPECT_EQ(call.args[1].name, "eqvalue1");
    EXPECT_EQ(call.args[1].value, "-3");
    EXPECT_EQ(call.args[7].name, "eqvalue7");
    EXPECT_EQ(call.args[7].value, "1");
    for (const ApiArg& arg : call.args) {
        EXPECT_EQ(arg.type, "dec");
    }
}

TEST(CommandTableTests, EqValuesWrongCountRejected) {
    const CommandSpec* spec = findCommand("set_eq_values");
    ApiCall call;
    EXPECT_EQ(buildApiCall(*spec, "1,2,3", call).code, WamErrorCode::InvalidArgument);
    EXPECT_EQ(buildApiCall(*spec, "1,2,3,4,5,6,7,8,9", call).code, WamErrorCode::InvalidArgument);
    EXPECT_EQ(buildApiCall(*spec, "", call).code, WamErrorCode::InvalidArgument);
}

TEST(CommandTableTests, EqValuesNonIntegerRejected) {
    ApiCall call;
    WamError err = buildApiCall(*findCommand("set_eq_values"), "1,2,3,x,5,6,7,8", call);
    EXPECT_EQ(err.code, WamErrorCode::InvalidArgument);
}

TEST(CommandTableTests, ParseIntegerIsStrict) {
    long value = 0;
    EXPECT_TRUE(parseInteger(" 42 ", value));
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(parseInteger("-7", value));
    EXPECT_EQ(value, -7);
    EXPECT_FALSE(parseInteger("4x", value));
    EXPECT_FALSE(parseInteger("", value));
    EXPECT_FALSE(parseInteger("99999999999999999999999", value));
}

TEST(CommandTableTests, ValidateApiCallAcceptsTableOutput) {
    for (const CommandSpec& spec : commandTable()) {
        if (spec.encoding == ArgEncoding::EqValueList) continue;
        ApiCall call;
        ASSERT_TRUE(buildApiCall(spec, "", call).ok()) << spec.logicalName;
        EXPECT_TRUE(validateApiCall(call).ok()) << spec.logicalName;
    }
}

TEST(CommandTableTests, ValidateApiCallRejectsMalformed) {
    ApiCall call;
    call.apiType = "CPM";
    call.method = "GetRadioInfo";
    EXPECT_TRUE(validateApiCall(call).ok());

    call.method = "";
    EXPECT_EQ(validateApiCall(call).code, WamErrorCode::InvalidArgument);

    call.method = "GetRadioInfo";
    call.apiType = "uic";
    EXPECT_EQ(validateApiCall(call).code, WamErrorCode::InvalidArgument);

    call.apiType = "UIC";
    call.args.push_back({"", "1", "dec"});
    EXPECT_EQ(validateApiCall(call).code, WamErrorCode::InvalidArgument);
}
