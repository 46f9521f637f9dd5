#include "display.h"

#include <array>
#include <iomanip>
#include <sstream>
#include <string>

#include "board.h"
#include "model.h"

namespace g2048::display {

namespace {

enum class Color_codes : int
{
  BLACK = 30,
  RED = 31,
  GREEN = 32,
  YELLOW = 33,
  BLUE = 34,
  MAGENTA = 35,
  CYAN = 36,
  WHITE = 37,
  B_BLACK = 90,
  B_RED = 91,
  B_GREEN = 92,
  B_YELLOW = 93,
  B_BLUE = 94,
  B_MAGENTA = 95,
  B_CYAN = 96,
  B_WHITE = 97,
};

/** Colors cycle with the exponent of the tile value: 2, 4, 8, ... */
const std::array<Color_codes, 11> Tile_colors{
    Color_codes::WHITE,    Color_codes::B_YELLOW, Color_codes::YELLOW,
    Color_codes::B_RED,    Color_codes::RED,      Color_codes::B_MAGENTA,
    Color_codes::MAGENTA,  Color_codes::B_BLUE,   Color_codes::BLUE,
    Color_codes::B_CYAN,   Color_codes::B_GREEN,
};

int exponent(int value)
{
  int exp = 0;
  while (value > 1)
  {
    value >>= 1;
    ++exp;
  }
  return exp;
}

std::string color_unicode(int value)
{
  auto ndx = (exponent(value) - 1) % Tile_colors.size();
  return std::to_string(to_integral(Tile_colors[ndx]));
}

std::string print_cell(int value, Output output_mode)
{
  std::stringstream ss;

  if (value == EMPTY)
  {
    ss << "|    ";
    return ss.str();
  }

  ss << '|';
  if (output_mode == Output::CONSOLE)
  {
    ss << "\033[1;" << color_unicode(value) << "m" << std::setw(4) << value
       << "\033[0m";
  }
  else
  {
    ss << std::setw(4) << value;
  }
  return ss.str();
}

} // namespace

const std::string to_string(const Board& board, Output output_mode)
{
  const int size = board.size();
  std::stringstream ss;

  for (int row = size - 1; row >= 0; --row)
  {
    for (int col = 0; col < size; ++col)
    {
      auto tile = board.tile(col, row);
      ss << print_cell(tile ? tile->value : EMPTY, output_mode);
    }
    ss << "|\n";
  }

  return ss.str();
}

const std::string to_string(const Model& model, Output output_mode)
{
  std::stringstream ss;

  ss << "\n[\n" << to_string(model.board(), output_mode) << "] " << model.score()
     << " (max: " << model.max_score() << ") (game is "
     << (model.game_over() ? "over" : "not over") << ")\n";

  return ss.str();
}

} // namespace g2048::display
