#include "input.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace {

TEST(InputTest, ClassifiesLines) {
    std::istringstream in("echo hi\n   \n");

    auto first = input::read_command(in);
    EXPECT_EQ(first.state, input::InputState::Valid);
    ASSERT_EQ(first.command.args.size(), 2u);
    EXPECT_EQ(first.command.args[1], "hi");

    auto second = input::read_command(in);
    EXPECT_EQ(second.state, input::InputState::Empty);
    EXPECT_TRUE(second.command.empty());

    auto third = input::read_command(in);
    EXPECT_EQ(third.state, input::InputState::Exiting);
}

TEST(InputTest, EndOfInputIsExiting) {
    std::istringstream in("");
    EXPECT_EQ(input::read_command(in).state, input::InputState::Exiting);
}

TEST(InputTest, LastLineWithoutNewlineIsRead) {
    std::istringstream in("exit");
    auto result = input::read_command(in);
    EXPECT_EQ(result.state, input::InputState::Valid);
    EXPECT_EQ(result.command.name(), "exit");
}

} // namespace
