#include "specvis/app_config.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace specvis {
namespace {

class AppConfigTest : public ::testing::Test {
protected:
    static AppConfig parse(std::initializer_list<const char*> args) {
        std::vector<const char*> argv{"specvis"};
        argv.insert(argv.end(), args.begin(), args.end());
        return parse_args(static_cast<int>(argv.size()), argv.data());
    }

    static std::string error_for(std::initializer_list<const char*> args) {
        try {
            (void)parse(args);
        } catch (const std::invalid_argument& e) {
            return e.what();
        }
        return {};
    }
};

TEST_F(AppConfigTest, DefaultsWithoutArguments) {
    const auto config = parse({});
    EXPECT_EQ(config.display.style, RenderStyle::Bars);
    EXPECT_EQ(config.display.quality, RenderQuality::Medium);
    EXPECT_FALSE(config.display.overlay);
    EXPECT_EQ(config.display.bar_count, 64u);
    EXPECT_EQ(config.display.bar_spacing, 1);
    EXPECT_EQ(config.display.fps, 60);
    EXPECT_TRUE(config.display.limit_fps);
    EXPECT_EQ(config.fft.fft_size, 2048u);
    EXPECT_EQ(config.converter.scale, SpectrumScale::Logarithmic);
    EXPECT_EQ(config.audio.device_index, -1);
    EXPECT_EQ(config.log_file, "specvis.log");
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_FALSE(config.list_devices);
    EXPECT_FALSE(config.show_help);
}

TEST_F(AppConfigTest, ParsesEveryOption) {
    const auto config = parse({"--style", "led-meter", "--quality", "HIGH", "--overlay",
                               "--bars", "128", "--spacing", "0", "--fps", "30",
                               "--unlimited-fps", "--fft-size", "4096", "--scale", "bark",
                               "--device", "3",
                               "--list-devices", "--log-file", "/tmp/x.log",
                               "--log-level", "debug"});
    EXPECT_EQ(config.display.style, RenderStyle::LedMeter);
    EXPECT_EQ(config.display.quality, RenderQuality::High);
    EXPECT_TRUE(config.display.overlay);
    EXPECT_EQ(config.display.bar_count, 128u);
    EXPECT_EQ(config.display.bar_spacing, 0);
    EXPECT_EQ(config.display.fps, 30);
    EXPECT_FALSE(config.display.limit_fps);
    EXPECT_EQ(config.fft.fft_size, 4096u);
    EXPECT_EQ(config.converter.scale, SpectrumScale::Bark);
    EXPECT_EQ(config.audio.device_index, 3);
    EXPECT_TRUE(config.list_devices);
    EXPECT_EQ(config.log_file, "/tmp/x.log");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
}

TEST_F(AppConfigTest, HelpFlags) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST_F(AppConfigTest, LaterOptionsWin) {
    EXPECT_EQ(parse({"--bars", "8", "--bars", "16"}).display.bar_count, 16u);
}

TEST_F(AppConfigTest, RejectsUnknownOption) {
    EXPECT_EQ(error_for({"--colour"}), "Unknown option: --colour");
}

TEST_F(AppConfigTest, RejectsMissingValue) {
    EXPECT_EQ(error_for({"--bars"}), "Missing value for --bars");
}

TEST_F(AppConfigTest, RejectsOutOfRangeNumbers) {
    EXPECT_NE(error_for({"--bars", "0"}).find("--bars"), std::string::npos);
    EXPECT_NE(error_for({"--bars", "513"}).find("1..512"), std::string::npos);
    EXPECT_NE(error_for({"--spacing", "9"}).find("--spacing"), std::string::npos);
    EXPECT_NE(error_for({"--fps", "0"}).find("--fps"), std::string::npos);
    EXPECT_NE(error_for({"--device", "-2"}).find("--device"), std::string::npos);
    EXPECT_EQ(parse({"--device", "-1"}).audio.device_index, -1);
}

TEST_F(AppConfigTest, RejectsMalformedNumbers) {
    EXPECT_EQ(error_for({"--bars", "12x"}),
              "Invalid value '12x' for --bars (expected an integer in 1..512)");
    EXPECT_FALSE(error_for({"--fps", ""}).empty());
    EXPECT_FALSE(error_for({"--bars", "-4"}).empty());
}

TEST_F(AppConfigTest, FFTSizeMustBePowerOfTwo) {
    EXPECT_NE(error_for({"--fft-size", "1000"}).find("power of two"), std::string::npos);
    EXPECT_FALSE(error_for({"--fft-size", "32"}).empty());
    EXPECT_FALSE(error_for({"--fft-size", "65536"}).empty());
    EXPECT_EQ(parse({"--fft-size", "64"}).fft.fft_size, 64u);
}

TEST_F(AppConfigTest, NamedValueErrorsMentionTheOption) {
    const auto style = error_for({"--style", "spiral"});
    EXPECT_EQ(style.rfind("--style: ", 0), 0u);
    EXPECT_NE(style.find("spiral"), std::string::npos);
    EXPECT_EQ(error_for({"--quality", "ultra"}).rfind("--quality: ", 0), 0u);
    EXPECT_EQ(error_for({"--scale", "octave"}).rfind("--scale: ", 0), 0u);
    EXPECT_EQ(error_for({"--log-level", "trace"}).rfind("--log-level: ", 0), 0u);
}

TEST_F(AppConfigTest, RejectsEmptyLogFile) {
    EXPECT_FALSE(error_for({"--log-file", ""}).empty());
}

TEST_F(AppConfigTest, UsageListsOptions) {
    const auto text = usage("specvis-test");
    EXPECT_EQ(text.rfind("Usage: specvis-test", 0), 0u);
    for (const char* option : {"--style", "--quality", "--overlay", "--bars", "--spacing", "--fps",
                               "--unlimited-fps", "--fft-size", "--scale", "--device",
                               "--list-devices", "--log-file", "--log-level"}) {
        EXPECT_NE(text.find(option), std::string::npos) << option;
    }
    EXPECT_EQ(usage(nullptr).rfind("Usage: specvis ", 0), 0u);
}

}  // namespace
}  // namespace specvis
