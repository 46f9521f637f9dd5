#include "board.h"
#include "config.h"
#include "display.h"
#include "model.h"
#include "rules.h"
#include "spawner.h"
#include "tilt.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

using namespace g2048;
using namespace g2048::display;


const std::string COMMANDS = "Enter w/a/s/d (or up/left/down/right) to tilt, n for a new game, q to quit";

void setup_logging(const Config& cfg)
{
  if (!cfg.log_file.empty())
  {
    auto logger = spdlog::rotating_logger_mt("g2048", cfg.log_file,
                                             LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
    spdlog::set_default_logger(logger);
  }
  spdlog::set_level(cfg.log_level);
}

/** Add a random tile, if there is room for one. */
void spawn(Model& model, TileSpawner& spawner)
{
  if (auto tile = spawner.spawn(model.board()))
    model.add_tile(*tile);
}

/** Start a game, either from the board file or with two random tiles. */
void new_game(Model& model, TileSpawner& spawner, const Config& cfg)
{
  if (!cfg.board_file.empty())
  {
    model.load(read_board_file(cfg.board_file));
    spdlog::info("Loaded a board of size {} from {}", model.size(), cfg.board_file);
    return;
  }
  model.clear();
  spawn(model, spawner);
  spawn(model, spawner);
}

int run(const Config& cfg)
{
  TileSpawner spawner = cfg.seed ? TileSpawner(*cfg.seed) : TileSpawner();
  Model model(cfg.size, cfg.max_piece);

  // Render once per command, after all the changes it caused.
  bool changed = false;
  model.add_listener([&changed](const Model&) { changed = true; });

  new_game(model, spawner, cfg);
  PRINT(to_string(model));
  PRINT(COMMANDS);

  std::string command;
  while (std::cin >> command)
  {
    changed = false;

    if (command == "q")
      break;
    if (command == "n")
    {
      spdlog::info("New game requested, score was {}", model.score());
      new_game(model, spawner, cfg);
    }
    else if (auto side = side_from_string(command); !side)
    {
      PRINT(command, " is an invalid command. ", COMMANDS);
    }
    else if (model.game_over())
    {
      PRINT("The game is over. Enter n for a new game or q to quit.");
    }
    else if (!engine::can_tilt(model.board(), *side))
    {
      PRINT("Nothing moves towards ", to_string(*side), ".");
    }
    else if (model.tilt(*side))
    {
      spawn(model, spawner);
      if (model.game_over())
      {
        spdlog::info("Game over: score {}, max score {}", model.score(), model.max_score());
        PRINT(to_string(model));
        const bool won = rules::max_tile_exists(model.board(), model.max_piece());
        PRINT(won ? "YOU WIN! " : "GAME OVER. ",
              "SCORE : ", model.score(), "  MAX SCORE : ", model.max_score());
        continue;
      }
    }

    if (changed)
      PRINT(to_string(model));
  }

  return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
  std::ios_base::sync_with_stdio(false);

  Config cfg;
  try
  {
    cfg = parse_args(argc, argv);
  }
  catch (const std::invalid_argument& e)
  {
    std::cerr << e.what() << '\n' << USAGE << std::endl;
    return EXIT_FAILURE;
  }

  try
  {
    setup_logging(cfg);
    return run(cfg);
  }
  catch (const std::exception& e)
  {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
}
