#ifndef __G2048_RULES_H_
#define __G2048_RULES_H_

#include "types.h"

namespace g2048 {

class Board;

namespace rules {

/**
 * @Return true if at least one cell of the board is empty.
 */
bool empty_space_exists(const Board&);

/**
 * @Return true if any tile has the maximum piece value.
 */
bool max_tile_exists(const Board&, int max_piece = MAX_PIECE);

/**
 * @Return true if a tilt can still change the board. That is the case when
 * there is an empty cell, or two orthogonally adjacent tiles of equal value.
 */
bool at_least_one_move_exists(const Board&);

/**
 * The game is over when the maximum piece was reached or when no move
 * remains.
 */
bool is_game_over(const Board&, int max_piece = MAX_PIECE);

} // namespace rules
} // namespace g2048

#endif
