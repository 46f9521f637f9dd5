#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "spdlog/spdlog.h"
#include "config.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>


namespace g2048 {

namespace {

class ConfigTest : public ::testing::Test {
protected:
    static Config parse(std::vector<const char*> args)
    {
        args.insert(args.begin(), "g2048");
        return parse_args(static_cast<int>(args.size()), args.data());
    }

    void TearDown() override
    {
        for (const auto& path : files) {
            std::filesystem::remove(path);
        }
    }

    std::string write_file(const std::string& name, const std::string& content)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream _of(path);
        _of << content;
        files.push_back(path);
        return path.string();
    }

    std::vector<std::filesystem::path> files;
};


TEST_F(ConfigTest, DefaultsWithoutArguments)
{
    Config cfg = parse({});

    EXPECT_EQ(cfg.size, DEFAULT_SIZE);
    EXPECT_EQ(cfg.max_piece, MAX_PIECE);
    EXPECT_EQ(cfg.seed, std::nullopt);
    EXPECT_EQ(cfg.log_level, spdlog::level::info);
    EXPECT_TRUE(cfg.log_file.empty());
    EXPECT_TRUE(cfg.board_file.empty());
}

TEST_F(ConfigTest, ParsesAllOptions)
{
    Config cfg = parse({"--size", "5", "--target", "1024", "--seed", "17",
                        "--log-level", "debug", "--log-file", "logs/g2048.txt",
                        "--board", "data/board.txt"});

    EXPECT_EQ(cfg.size, 5);
    EXPECT_EQ(cfg.max_piece, 1024);
    EXPECT_THAT(cfg.seed, ::testing::Optional(17u));
    EXPECT_EQ(cfg.log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.log_file, "logs/g2048.txt");
    EXPECT_EQ(cfg.board_file, "data/board.txt");
}

TEST_F(ConfigTest, RejectsMalformedCommandLines)
{
    EXPECT_THROW(parse({"--colors", "5"}), std::invalid_argument);
    EXPECT_THROW(parse({"--size"}), std::invalid_argument);
    EXPECT_THROW(parse({"--size", "four"}), std::invalid_argument);
    EXPECT_THROW(parse({"--size", "4x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--seed", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--log-level", "loud"}), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsUnplayableGames)
{
    EXPECT_THROW(parse({"--size", "1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--target", "1000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--target", "2"}), std::invalid_argument);
    EXPECT_NO_THROW(parse({"--size", "2", "--target", "4"}));
}

TEST_F(ConfigTest, LogLevelOffIsAccepted)
{
    EXPECT_EQ(parse({"--log-level", "off"}).log_level, spdlog::level::off);
}

TEST_F(ConfigTest, ReadsABoardFile)
{
    const std::string path = write_file("g2048_board_2.txt", "2\n0 2\n4 0\n");

    EXPECT_EQ(read_board_file(path), Board(std::vector<std::vector<int>>{
        {0, 2},
        {4, 0},
    }));
}

TEST_F(ConfigTest, BoardFileMustHoldAPlayableBoard)
{
    const std::string tiny = write_file("g2048_board_1.txt", "1\n2\n");
    const std::string garbled = write_file("g2048_board_bad.txt", "2\n0 3\n4 0\n");

    EXPECT_THROW(read_board_file(tiny), std::invalid_argument);
    EXPECT_THROW(read_board_file(garbled), std::invalid_argument);
}

TEST_F(ConfigTest, MissingBoardFileThrows)
{
    const auto path = std::filesystem::temp_directory_path() / "g2048_no_such_board.txt";
    std::filesystem::remove(path);

    EXPECT_THROW(read_board_file(path.string()), std::runtime_error);
}

} // namespace
} // namespace g2048
