#include "config.h"

#include <fstream>
#include <stdexcept>
#include <string>

namespace g2048 {

const std::string USAGE =
    "usage: g2048 [--size N] [--target N] [--seed N] [--log-level LEVEL]"
    " [--log-file PATH] [--board PATH]";

namespace {

int to_int(const std::string& option, const std::string& value)
{
  std::size_t pos = 0;
  int ret = 0;
  try
  {
    ret = std::stoi(value, &pos);
  }
  catch (const std::exception&)
  {
    throw std::invalid_argument(option + " expects an integer, got '" + value + "'");
  }
  if (pos != value.size())
    throw std::invalid_argument(option + " expects an integer, got '" + value + "'");
  return ret;
}

} // namespace

Config parse_args(int argc, const char* const argv[])
{
  Config cfg {};

  for (int i = 1; i < argc; ++i)
  {
    const std::string option = argv[i];
    if (i + 1 >= argc)
      throw std::invalid_argument("missing value for option " + option);
    const std::string value = argv[++i];

    if (option == "--size")
    {
      cfg.size = to_int(option, value);
    }
    else if (option == "--target")
    {
      cfg.max_piece = to_int(option, value);
    }
    else if (option == "--seed")
    {
      const int seed = to_int(option, value);
      if (seed < 0)
        throw std::invalid_argument("--seed expects a non-negative integer");
      cfg.seed = static_cast<uint32_t>(seed);
    }
    else if (option == "--log-level")
    {
      cfg.log_level = spdlog::level::from_str(value);
      // from_str falls back to `off` on unknown names.
      if (cfg.log_level == spdlog::level::off && value != "off")
        throw std::invalid_argument("unknown log level '" + value + "'");
    }
    else if (option == "--log-file")
    {
      cfg.log_file = value;
    }
    else if (option == "--board")
    {
      cfg.board_file = value;
    }
    else
    {
      throw std::invalid_argument("unknown option " + option);
    }
  }

  validate(cfg);
  return cfg;
}

void validate(const Config& cfg)
{
  if (cfg.size < MIN_PLAY_SIZE)
    throw std::invalid_argument("board size must be at least " + std::to_string(MIN_PLAY_SIZE));
  if (!is_tile_value(cfg.max_piece) || cfg.max_piece < 4)
    throw std::invalid_argument("target must be a power of two >= 4, got "
                                + std::to_string(cfg.max_piece));
}

Board read_board_file(const std::string& path)
{
  std::ifstream _if(path, std::ios::in);
  if (!_if)
    throw std::runtime_error("could not open board file " + path);

  Board board(_if);
  if (board.size() < MIN_PLAY_SIZE)
  {
    spdlog::warn("Board file {} holds a board of size {}", path, board.size());
    throw std::invalid_argument("board size must be at least " + std::to_string(MIN_PLAY_SIZE)
                                + ", " + path + " holds one of size " + std::to_string(board.size()));
  }
  return board;
}

} // namespace g2048
