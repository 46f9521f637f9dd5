#include "rules.h"
#include "board.h"

#include <algorithm>

namespace g2048::rules {

bool empty_space_exists(const Board& _board)
{
  const auto& cells = _board.cells();
  return std::find(cells.begin(), cells.end(), EMPTY) != cells.end();
}

bool max_tile_exists(const Board& _board, int max_piece)
{
  const auto& cells = _board.cells();
  return std::find(cells.begin(), cells.end(), max_piece) != cells.end();
}

namespace {

/**
 * @Return true if the tile at (col, row) has a right or upper neighbor of
 * the same value it can merge with. Checking those two directions for every
 * cell covers all the adjacent pairs.
 */
bool same_as_right_or_up_nbh(const Board& _board, int col, int row)
{
  const auto value = _board.tile(col, row)->value;
  const int size = _board.size();
  if (!can_merge(value))
    return false;

  if (col < size - 1)
  {
    if (auto right = _board.tile(col + 1, row); right && right->value == value)
      return true;
  }
  if (row < size - 1)
  {
    if (auto up = _board.tile(col, row + 1); up && up->value == value)
      return true;
  }
  return false;
}

} // namespace

bool at_least_one_move_exists(const Board& _board)
{
  if (empty_space_exists(_board))
    return true;

  const int size = _board.size();
  for (int col = 0; col < size; ++col)
  {
    for (int row = 0; row < size; ++row)
    {
      if (same_as_right_or_up_nbh(_board, col, row))
        return true;
    }
  }
  return false;
}

bool is_game_over(const Board& _board, int max_piece)
{
  return max_tile_exists(_board, max_piece) || !at_least_one_move_exists(_board);
}

} // namespace g2048::rules
