/// model.h
///
#ifndef __G2048_MODEL_H_
#define __G2048_MODEL_H_

#include "board.h"
#include "types.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <vector>

namespace g2048 {

/**
 * @Class The state of a game of 2048: the board, the score, the best score
 * and whether the game is over.
 *
 * @Note The game over flag is recomputed after every mutation. The maximum
 * score follows the score for as long as the game is over.
 */
class Model
{
 public:
  using Listener = std::function<void(const Model&)>;
  using ListenerId = std::size_t;

  explicit Model(int size = DEFAULT_SIZE, int max_piece = MAX_PIECE);
  /**
   * A game whose board holds the given values, listed top row first
   * (0 for an empty cell). Mostly useful for tests.
   */
  Model(const std::vector<std::vector<int>>& raw_values, Score score, Score max_score,
        bool game_over, int max_piece = MAX_PIECE);
  explicit Model(Board&&, int max_piece = MAX_PIECE);

  Model(const Model&) = default;
  Model(Model&&) noexcept = default;
  Model& operator=(const Model&) = default;
  Model& operator=(Model&&) noexcept = default;

  /**
   * Tilt the board towards `side`, add the merged values to the score and
   * notify the listeners if anything moved.
   *
   * @Return true iff the board changed.
   */
  bool tilt(Side);

  /** Empty the board and reset the score. */
  void clear();

  /** Add `tile` to the board. There must be no tile at its position. */
  void add_tile(const Tile&);

  /**
   * Start a game on `board`. The score is reset while the maximum score and
   * the listeners are kept, as for `clear`.
   */
  void load(Board&&);

  std::optional<Tile> tile(int col, int row) const { return m_board.tile(col, row); }
  int size() const { return m_board.size(); }
  const Board& board() const { return m_board; }
  Score score() const { return m_score; }
  Score max_score() const { return m_max_score; }
  int max_piece() const { return m_max_piece; }
  bool game_over() const { return m_game_over; }

  /**
   * Register a callback invoked after every change of the state. A listener
   * may add or remove listeners, itself included, while it is notified.
   *
   * @Return An id to pass to `remove_listener`.
   */
  ListenerId add_listener(Listener);
  void remove_listener(ListenerId);

  bool operator==(const Model& other) const
  {
    return m_board == other.m_board && m_score == other.m_score
        && m_max_score == other.m_max_score && m_game_over == other.m_game_over;
  }
  bool operator!=(const Model& other) const { return !(*this == other); }

 private:
  Board m_board;
  Score m_score;
  Score m_max_score;
  bool m_game_over;
  int m_max_piece;

  ListenerId m_next_id { 0 };
  std::map<ListenerId, Listener> m_listeners;

  void check_game_over();
  void notify() const;
};

extern std::ostream& operator<<(std::ostream&, const Model&);

} // namespace g2048

#endif
