#include "tilt.h"
#include "board.h"

#include <vector>

#include "spdlog/spdlog.h"

namespace g2048::engine {

namespace {

/**
 * Flags the canonical cells holding a tile that results from a merge
 * during the current tilt.
 */
class MoveTrace
{
 public:
  explicit MoveTrace(int size) : m_size(size), m_merged(size * size, false) {}

  bool merged(int col, int row) const { return m_merged[col + row * m_size]; }
  void set_merged(int col, int row) { m_merged[col + row * m_size] = true; }

 private:
  int m_size;
  std::vector<bool> m_merged;
};

/**
 * The row where the tile at canonical (col, row) comes to rest when moved
 * up: either the last empty cell before an obstacle, or the cell of a tile
 * of same value it can merge with. Tiles of MAX_TILE_VALUE never merge.
 */
int find_destination(const Board& _board, const MoveTrace& _trace,
                     Side _side, int col, int row)
{
  const int value = _board.tile(col, row, _side)->value;
  int dest = row;

  for (int y = row + 1; y < _board.size(); ++y)
  {
    dest = y;
    auto above = _board.tile(col, y, _side);
    if (!above)
      continue;
    if (above->value != value || !can_merge(value) || _trace.merged(col, y))
      --dest;
    break;
  }
  return dest;
}

/**
 * Move all the tiles of the board up, in the perspective of `side`.
 * Rows are visited from the top so that the leading tiles settle first.
 */
TiltResult move_up(Board& _board, Side _side)
{
  TiltResult res {};
  const int size = _board.size();
  MoveTrace trace(size);

  for (int col = 0; col < size; ++col)
  {
    for (int row = size - 1; row >= 0; --row)
    {
      auto tile = _board.tile(col, row, _side);
      if (!tile)
        continue;

      const int dest = find_destination(_board, trace, _side, col, row);
      if (dest == row)
        continue;

      res.changed = true;
      if (_board.move(col, dest, *tile, _side))
      {
        trace.set_merged(col, dest);
        res.score_delta += 2 * static_cast<Score>(tile->value);
        ++res.merges;
      }
    }
  }
  return res;
}

} // namespace

TiltResult tilt(Board& _board, Side _side)
{
  TiltResult res = move_up(_board, _side);
  spdlog::debug("Tilt {}: changed={}, merges={}, score_delta={}",
                to_string(_side), res.changed, res.merges, res.score_delta);
  return res;
}

bool can_tilt(const Board& _board, Side _side)
{
  Board copy = _board;
  return move_up(copy, _side).changed;
}

} // namespace g2048::engine
