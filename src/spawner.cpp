#include "spawner.h"
#include "board.h"

#include <vector>

#include "spdlog/spdlog.h"

namespace g2048 {

std::optional<Tile> TileSpawner::spawn(const Board& _board)
{
  const int size = _board.size();
  std::vector<int> empty_cells;
  empty_cells.reserve(size * size - _board.tile_count());

  for (int ndx = 0; ndx < size * size; ++ndx)
  {
    if (_board.cells()[ndx] == EMPTY)
      empty_cells.push_back(ndx);
  }

  if (empty_cells.empty())
  {
    spdlog::debug("No empty cell left to spawn a tile");
    return std::nullopt;
  }

  const int cell = empty_cells[m_rand.get(0, static_cast<int>(empty_cells.size()) - 1)];
  const int value = m_rand.chance(SPAWN_TWO_PROBABILITY) ? 2 : 4;

  return Tile { value, cell % size, cell / size };
}

} // namespace g2048
