#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JsonUtil.h"
#include <chrono>
#include <string>

namespace cam_scan {
namespace jsonutil {

TEST(JsonUtilTest, EscapePlainText) {
    EXPECT_EQ(escape(""), "");
    EXPECT_EQ(escape("Hikvision"), "Hikvision");
}

TEST(JsonUtilTest, EscapeQuotesAndBackslashes) {
    EXPECT_EQ(escape("He said \"Hello\""), "He said \\\"Hello\\\"");
    EXPECT_EQ(escape("C:\\cams"), "C:\\\\cams");
}

TEST(JsonUtilTest, EscapeWhitespaceControls) {
    EXPECT_EQ(escape("a\nb\rc\td"), "a\\nb\\rc\\td");
    EXPECT_EQ(escape("\b\f"), "\\b\\f");
}

TEST(JsonUtilTest, EscapeOtherControlCharacters) {
    EXPECT_EQ(escape("Test\x01\x1f"), "Test\\u0001\\u001f");
    std::string with_nul = "a";
    with_nul += '\0';
    EXPECT_EQ(escape(with_nul), "a\\u0000");
}

TEST(JsonUtilTest, Utf8PassesThrough) {
    EXPECT_EQ(escape("Caf\xC3\xA9"), "Caf\xC3\xA9");
}

TEST(JsonUtilTest, TimeToIso) {
    auto tp = std::chrono::system_clock::from_time_t(1700000000);
    EXPECT_EQ(time_to_iso(tp), "2023-11-14T22:13:20Z");
    EXPECT_EQ(time_to_iso(std::chrono::system_clock::time_point{}), "");
}

}
}
