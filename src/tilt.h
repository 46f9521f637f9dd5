#ifndef __G2048_TILT_H_
#define __G2048_TILT_H_

#include "types.h"

namespace g2048 {

class Board;

namespace engine {

/**
 * Tilt the board towards `side`: every tile slides as far as it can in that
 * direction, and two adjacent tiles of equal value in the direction of
 * motion merge into one tile of twice the value.
 *
 * A tile that is the result of a merge does not merge again during the same
 * tilt. When three equal tiles are lined up in the direction of motion, the
 * leading two merge and the trailing one does not.
 *
 * @Return A descriptor of the tilt: whether the board changed, the sum of
 * the values of the merged tiles and the number of merges.
 */
TiltResult tilt(Board&, Side);

/**
 * Same as `tilt(Board&, Side)` on a copy of the board.
 *
 * @Return true iff tilting towards `side` would change the board.
 */
bool can_tilt(const Board&, Side);

} // namespace engine
} // namespace g2048

#endif
