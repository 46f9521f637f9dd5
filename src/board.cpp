// board.cpp
#include "board.h"

#include <algorithm>
#include <istream>
#include <stdexcept>
#include <string>

#include "spdlog/spdlog.h"

namespace g2048 {

namespace perspective {

std::pair<int, int> to_board(int c, int r, Side side, int size)
{
  switch (side)
  {
    case Side::North: return { c, r };
    case Side::East:  return { r, size - 1 - c };
    case Side::South: return { size - 1 - c, size - 1 - r };
    case Side::West:  return { size - 1 - r, c };
  }
  return { c, r };
}

} // namespace perspective

namespace {

[[noreturn]] void contract_error(const std::string& what)
{
  spdlog::warn("Board: {}", what);
  throw std::invalid_argument(what);
}

void check_value(int value)
{
  if (value != EMPTY && !is_tile_value(value))
    contract_error("invalid tile value " + std::to_string(value));
}

} // namespace

//****************************************** Constructors ***************************************/

Board::Board(int size)
  : m_size(size), m_cells{}
{
  if (size < 1)
    contract_error("board size must be positive, got " + std::to_string(size));
  m_cells.assign(m_size * m_size, EMPTY);
}

Board::Board(const std::vector<std::vector<int>>& raw)
  : m_size(static_cast<int>(raw.size())), m_cells{}
{
  if (m_size < 1)
    contract_error("raw board is empty");
  m_cells.assign(m_size * m_size, EMPTY);

  for (int y = 0; y < m_size; ++y)
  {
    const auto& raw_row = raw[y];
    if (static_cast<int>(raw_row.size()) != m_size)
      contract_error("raw board is not square");

    // The first raw row is the top one.
    const int row = m_size - 1 - y;
    for (int col = 0; col < m_size; ++col)
    {
      check_value(raw_row[col]);
      m_cells[index(col, row)] = raw_row[col];
    }
  }
}

Board::Board(std::istream& _in)
  : m_size(0), m_cells{}
{
  if (!(_in >> m_size) || m_size < 1)
    contract_error("could not read a positive board size");
  m_cells.assign(m_size * m_size, EMPTY);

  int _in_value { 0 };
  for (int row = m_size - 1; row >= 0; --row)
  {
    for (int col = 0; col < m_size; ++col)
    {
      if (!(_in >> _in_value))
        contract_error("board input ended before all cells were read");
      check_value(_in_value);
      m_cells[index(col, row)] = _in_value;
    }
  }
}

//****************************************** Access ***************************************/

void Board::check_bounds(int col, int row) const
{
  if (col < 0 || col >= m_size || row < 0 || row >= m_size)
    contract_error("cell (" + std::to_string(col) + ", " + std::to_string(row)
                   + ") is outside of a board of size " + std::to_string(m_size));
}

std::optional<Tile> Board::tile(int col, int row, Side side) const
{
  check_bounds(col, row);
  auto [x, y] = perspective::to_board(col, row, side, m_size);
  const int value = m_cells[index(x, y)];
  if (value == EMPTY)
    return std::nullopt;
  return Tile { value, x, y };
}

bool Board::empty() const
{
  return std::all_of(m_cells.begin(), m_cells.end(), [](int v) { return v == EMPTY; });
}

int Board::tile_count() const
{
  return static_cast<int>(
      std::count_if(m_cells.begin(), m_cells.end(), [](int v) { return v != EMPTY; }));
}

//****************************************** Mutations ***************************************/

bool Board::move(int col, int row, const Tile& tile, Side side)
{
  check_bounds(col, row);
  check_bounds(tile.col, tile.row);

  const int src = index(tile.col, tile.row);
  if (m_cells[src] != tile.value || tile.value == EMPTY)
    contract_error("moved tile is not on the board");

  auto [x, y] = perspective::to_board(col, row, side, m_size);
  const int dst = index(x, y);
  if (dst == src)
    return false;

  if (m_cells[dst] == EMPTY)
  {
    m_cells[dst] = tile.value;
    m_cells[src] = EMPTY;
    return false;
  }
  if (m_cells[dst] != tile.value)
    contract_error("cannot merge tiles of values " + std::to_string(tile.value)
                   + " and " + std::to_string(m_cells[dst]));
  if (!can_merge(tile.value))
    contract_error("merging two tiles of value " + std::to_string(tile.value)
                   + " overflows");

  m_cells[dst] = 2 * tile.value;
  m_cells[src] = EMPTY;
  return true;
}

void Board::add_tile(const Tile& tile)
{
  check_bounds(tile.col, tile.row);
  if (!is_tile_value(tile.value))
    contract_error("invalid tile value " + std::to_string(tile.value));
  int& cell = m_cells[index(tile.col, tile.row)];
  if (cell != EMPTY)
    contract_error("cell (" + std::to_string(tile.col) + ", " + std::to_string(tile.row)
                   + ") is already occupied");
  cell = tile.value;
}

void Board::clear()
{
  std::fill(m_cells.begin(), m_cells.end(), EMPTY);
}

} // namespace g2048
