#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "spdlog/spdlog.h"
#include "board.h"
#include "display.h"
#include "model.h"

#include <string>
#include <vector>


namespace g2048::display {

namespace {

using Raw = std::vector<std::vector<int>>;

class DisplayTest : public ::testing::Test {
protected:
    DisplayTest()
        : board(Raw{
            {0, 2},
            {1024, 0},
        })
    {}

    Board board;
};


TEST_F(DisplayTest, FileModeIsPlainText)
{
    EXPECT_EQ(to_string(board, Output::FILE),
              "|    |   2|\n"
              "|1024|    |\n");
}

TEST_F(DisplayTest, ConsoleModeColorsTheTiles)
{
    const std::string out = to_string(board, Output::CONSOLE);

    EXPECT_THAT(out, ::testing::HasSubstr("\033[1;"));
    EXPECT_THAT(out, ::testing::HasSubstr("1024\033[0m"));
    EXPECT_THAT(out, ::testing::StartsWith("|    |"));
}

TEST_F(DisplayTest, ModelAddsTheScoreLine)
{
    Model model(Raw{
        {0, 2},
        {1024, 0},
    }, 36, 120, false);

    EXPECT_EQ(to_string(model, Output::FILE),
              "\n[\n"
              "|    |   2|\n"
              "|1024|    |\n"
              "] 36 (max: 120) (game is not over)\n");
}

TEST_F(DisplayTest, GameOverIsShown)
{
    Model model(Board(Raw{{2048}}));

    EXPECT_THAT(to_string(model, Output::FILE), ::testing::HasSubstr("(game is over)"));
}

} // namespace
} // namespace g2048::display
