/**
 * @file test_user_name.cpp
 * @brief Unit tests for the UserName value object
 */

#include <gtest/gtest.h>
#include "usermanagement/domain/model/UserName.hpp"

#include <string>
#include <vector>

using namespace usermanagement::domain::model;

class UserNameTest : public ::testing::Test {
protected:
    static std::string invalidMessage(const std::string& value) {
        return "UserName is invalid: '" + value + "'.";
    }
};

// isValid tests
TEST_F(UserNameTest, IsValid_Empty) {
    EXPECT_FALSE(UserName::isValid(""));
}

TEST_F(UserNameTest, IsValid_SingleCharacter) {
    EXPECT_TRUE(UserName::isValid("a"));
}

TEST_F(UserNameTest, IsValid_ExactlyMaxLength) {
    EXPECT_TRUE(UserName::isValid(std::string(UserName::MAX_LENGTH, 'x')));
}

TEST_F(UserNameTest, IsValid_OneOverMaxLength) {
    EXPECT_FALSE(UserName::isValid(std::string(UserName::MAX_LENGTH + 1, 'x')));
}

// create tests
TEST_F(UserNameTest, Create_AcceptsEveryLengthInRange) {
    for (size_t length = 1; length <= 10; ++length) {
        std::string value(length, 'u');
        auto result = UserName::create(value);
        ASSERT_TRUE(result.isSuccess()) << "length " << length;
        EXPECT_EQ(result.getValue().getValue(), value);
    }
}

TEST_F(UserNameTest, Create_RejectsEmpty) {
    auto result = UserName::create("");
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.getError(), "UserName is invalid: ''.");
}

TEST_F(UserNameTest, Create_RejectsTooLong) {
    std::vector<std::string> values = {"abcdefghijk", "user name is too long", std::string(50, 'z')};
    for (const auto& value : values) {
        auto result = UserName::create(value);
        ASSERT_TRUE(result.isFailure()) << value;
        EXPECT_EQ(result.getError(), invalidMessage(value));
    }
}

TEST_F(UserNameTest, Create_NullPointerIsInvalid) {
    const char* missing = nullptr;
    auto result = UserName::create(missing);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.getError(), "UserName is invalid: ''.");
}

TEST_F(UserNameTest, Create_KeepsWhitespaceVerbatim) {
    auto result = UserName::create("  lisa  ");
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.getValue().getValue(), "  lisa  ");
}

TEST_F(UserNameTest, Create_LengthCountsBytes) {
    // "Zoë" is three characters but four bytes in UTF-8
    std::string nineChars = "Zo\xC3\xAB" "abcdef";
    EXPECT_EQ(nineChars.length(), 10u);
    EXPECT_TRUE(UserName::create(nineChars).isSuccess());
    EXPECT_TRUE(UserName::create(nineChars + "g").isFailure());
}

TEST_F(UserNameTest, Create_ErrorEmbedsInputWithQuotes) {
    std::string value = "it's 'quoted'";
    auto result = UserName::create(value);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.getError(), "UserName is invalid: 'it's 'quoted''.");
}

// value round trip
TEST_F(UserNameTest, Revalidating_ExtractedValueSucceeds) {
    std::vector<std::string> inputs = {"a", "lisa rocks", "0123456789", "x y"};
    for (const auto& input : inputs) {
        auto first = UserName::create(input);
        ASSERT_TRUE(first.isSuccess());

        auto second = UserName::create(first.getValue().getValue());
        ASSERT_TRUE(second.isSuccess());
        EXPECT_EQ(second.getValue(), first.getValue());
    }
}

// comparison tests
TEST_F(UserNameTest, Equality_SameValue) {
    auto a = UserName::create("homer").getValue();
    auto b = UserName::create("homer").getValue();
    auto c = UserName::create("marge").getValue();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < c);
}

TEST_F(UserNameTest, StringAccessors) {
    auto name = UserName::create("bart").getValue();
    EXPECT_EQ(name.toString(), "bart");
    EXPECT_EQ(name.length(), 4u);
    EXPECT_FALSE(name.isEmpty());
}
