/// board.h
///
#ifndef __G2048_BOARD_H_
#define __G2048_BOARD_H_

#include "types.h"

#include <iosfwd>
#include <optional>
#include <utility>
#include <vector>

namespace g2048 {

namespace perspective {

/**
 * Map the canonical coordinates (c, r) seen from the perspective of `side`
 * to the board coordinates. Under the perspective of `side`, moving towards
 * increasing canonical rows is moving towards `side` on the board.
 */
std::pair<int, int> to_board(int c, int r, Side side, int size);

} // namespace perspective

/**
 * @Class The square grid of a 2048 game.
 *
 * Every cell holds the value of its tile, or EMPTY. All accessors take an
 * optional `Side` giving the perspective in which the coordinates are
 * expressed; the board itself never stores an orientation.
 */
class Board
{
 public:
  using Cells = std::vector<int>;

  explicit Board(int size = DEFAULT_SIZE);
  /**
   * Build a board from its values listed as drawn, i.e. `raw[0]` is the top
   * row and `raw[size-1]` the bottom one. 0 denotes an empty cell.
   */
  explicit Board(const std::vector<std::vector<int>>& raw);
  /**
   * Read the size followed by size * size values, top row first.
   */
  explicit Board(std::istream&);

  int size() const { return m_size; }

  /**
   * @Return The tile at (col, row) of the given perspective, if any.
   */
  std::optional<Tile> tile(int col, int row, Side side = Side::North) const;

  /**
   * Move `tile` to the cell (col, row) of the given perspective. If that
   * cell holds a tile of the same value, the two are merged into a tile of
   * twice the value.
   *
   * @Return true iff a merge occurred.
   */
  bool move(int col, int row, const Tile& tile, Side side = Side::North);

  /** Place `tile` on the board. Its cell must be empty. */
  void add_tile(const Tile&);

  void clear();

  bool empty() const;
  int tile_count() const;
  /** The values of the cells, indexed by `col + row * size()`. */
  const Cells& cells() const { return m_cells; }

  bool operator==(const Board& other) const
  {
    return m_size == other.m_size && m_cells == other.m_cells;
  }
  bool operator!=(const Board& other) const { return !(*this == other); }

 private:
  int m_size;
  Cells m_cells;

  int index(int col, int row) const { return col + row * m_size; }
  void check_bounds(int col, int row) const;
};

} // namespace g2048

#endif
