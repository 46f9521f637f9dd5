#ifndef __G2048_CONFIG_H_
#define __G2048_CONFIG_H_

#include "board.h"
#include "types.h"

#include <cstdint>
#include <optional>
#include <string>

#include "spdlog/spdlog.h"

namespace g2048 {

inline constexpr auto MIN_PLAY_SIZE = 2;
inline constexpr auto LOG_FILE_MAX_SIZE = 1048576 * 5;
inline constexpr auto LOG_FILE_MAX_FILES = 3;

struct Config {
    int                           size       { DEFAULT_SIZE };
    int                           max_piece  { MAX_PIECE };
    std::optional<uint32_t>       seed       { };
    spdlog::level::level_enum     log_level  { spdlog::level::info };
    std::string                   log_file   { };
    std::string                   board_file { };
};

/**
 * Fill a Config from the command line:
 *
 *   --size N  --target N  --seed N  --log-level LEVEL  --log-file PATH  --board PATH
 *
 * @Note Throws std::invalid_argument on unknown options, missing or invalid
 * values.
 */
Config parse_args(int argc, const char* const argv[]);

/** Throws std::invalid_argument if the configuration cannot start a game. */
void validate(const Config&);

/**
 * Read a board from the text file at `path`: its size, then its values top
 * row first.
 *
 * @Note Throws std::runtime_error if the file cannot be opened and
 * std::invalid_argument if it does not hold a playable board.
 */
Board read_board_file(const std::string& path);

extern const std::string USAGE;

} // namespace g2048

#endif
