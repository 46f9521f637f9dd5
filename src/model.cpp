// model.cpp
#include "model.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "spdlog/spdlog.h"

#include "display.h"
#include "rules.h"
#include "tilt.h"

namespace g2048 {

namespace {

int checked_max_piece(int max_piece)
{
  if (!is_tile_value(max_piece) || max_piece < 4)
  {
    spdlog::warn("Model: invalid maximum piece {}", max_piece);
    throw std::invalid_argument("maximum piece must be a power of two >= 4, got "
                                + std::to_string(max_piece));
  }
  return max_piece;
}

} // namespace

Model::Model(int size, int max_piece)
  : m_board(size), m_score(0), m_max_score(0), m_game_over(false),
    m_max_piece(checked_max_piece(max_piece))
{
}

Model::Model(const std::vector<std::vector<int>>& raw_values, Score score, Score max_score,
             bool game_over, int max_piece)
  : m_board(raw_values), m_score(score), m_max_score(max_score), m_game_over(game_over),
    m_max_piece(checked_max_piece(max_piece))
{
}

Model::Model(Board&& board, int max_piece)
  : m_board(std::move(board)), m_score(0), m_max_score(0), m_game_over(false),
    m_max_piece(checked_max_piece(max_piece))
{
  check_game_over();
}

//****************************************** Actions ***************************************/

bool Model::tilt(Side side)
{
  TiltResult res = engine::tilt(m_board, side);
  m_score += res.score_delta;
  check_game_over();
  if (res.changed)
    notify();
  return res.changed;
}

void Model::clear()
{
  m_score = 0;
  m_game_over = false;
  m_board.clear();
  notify();
}

void Model::add_tile(const Tile& tile)
{
  m_board.add_tile(tile);
  check_game_over();
  notify();
}

void Model::load(Board&& board)
{
  m_board = std::move(board);
  m_score = 0;
  m_game_over = false;
  check_game_over();
  notify();
}

/**
 * While the game is over, the current score is a candidate for the maximum
 * score. A game that reached the maximum piece can still be tilted, so the
 * score may keep growing after the transition.
 */
void Model::check_game_over()
{
  const bool over = rules::is_game_over(m_board, m_max_piece);
  if (over)
    m_max_score = std::max(m_score, m_max_score);
  if (over && !m_game_over)
    spdlog::debug("Game over with score {} (max: {})", m_score, m_max_score);
  m_game_over = over;
}

//****************************************** Listeners ***************************************/

Model::ListenerId Model::add_listener(Listener listener)
{
  m_listeners.emplace(m_next_id, std::move(listener));
  return m_next_id++;
}

void Model::remove_listener(ListenerId id)
{
  m_listeners.erase(id);
}

/**
 * The ids are collected first: a listener may remove itself or others. A
 * listener removed during the notification is not called, and one added
 * during it is only called from the next notification on.
 */
void Model::notify() const
{
  std::vector<ListenerId> ids;
  ids.reserve(m_listeners.size());
  for (const auto& [id, listener] : m_listeners)
    ids.push_back(id);

  for (ListenerId id : ids)
  {
    auto it = m_listeners.find(id);
    if (it == m_listeners.end())
      continue;
    // The callback may erase its own entry.
    Listener listener = it->second;
    listener(*this);
  }
}

//*************************** Display *************************/

std::ostream& operator<<(std::ostream& _out, const Model& _model)
{
  return _out << display::to_string(_model, Output::FILE);
}

} // namespace g2048
