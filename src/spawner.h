#ifndef __G2048_SPAWNER_H_
#define __G2048_SPAWNER_H_

#include "rand.h"
#include "types.h"

#include <cstdint>
#include <optional>

namespace g2048 {

class Board;

inline constexpr auto SPAWN_TWO_PROBABILITY = 0.9;

/**
 * @Class Chooses the tiles that appear on the board between two tilts: a
 * uniformly random empty cell receives a 2 (90% of the time) or a 4.
 */
class TileSpawner
{
 public:
  TileSpawner() = default;
  explicit TileSpawner(uint32_t seed) : m_rand(seed) {}

  /**
   * @Return A new tile on an empty cell of the board, or nothing if the
   * board is full. The board is left untouched.
   */
  std::optional<Tile> spawn(const Board&);

 private:
  Rand::Util<int> m_rand{};
};

} // namespace g2048

#endif
