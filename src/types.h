// types.h
#ifndef __G2048_TYPES_H_
#define __G2048_TYPES_H_

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>


template <typename E>
auto inline constexpr to_integral(E e) {
    return static_cast<std::underlying_type_t<E>>(e);
}

template <typename E, typename I>
auto inline constexpr to_enum(I i) {
    return static_cast<E>(i);
}

namespace g2048 {

inline constexpr auto DEFAULT_SIZE = 4;
inline constexpr auto MAX_PIECE = 2048;
inline constexpr auto EMPTY = 0;
/** The largest power of two an int holds. Such a tile no longer merges. */
inline constexpr auto MAX_TILE_VALUE = std::numeric_limits<int>::max() / 2 + 1;

/** Scores add up the merged values of a whole game. */
using Score = int64_t;

/**
 * The four directions of a tilt. North is the canonical direction: the tilt
 * engine only knows how to move tiles towards increasing rows.
 */
enum class Side : uint8_t { North = 0, East = 1, South = 2, West = 3 };

inline constexpr std::array<Side, 4> ALL_SIDES {
    Side::North, Side::East, Side::South, Side::West
};

/**
 * A tile of the board, as seen from the board's (North) perspective.
 * (0, 0) is the lower-left corner.
 */
struct Tile {
    int value { 0 };
    int col   { 0 };
    int row   { 0 };
};

inline bool operator==(const Tile& a, const Tile& b)
{
    return a.value == b.value && a.col == b.col && a.row == b.row;
}
inline bool operator!=(const Tile& a, const Tile& b) { return !(a == b); }

/**
 * Descriptor of a tilt.
 */
struct TiltResult {
    bool  changed     { false };
    Score score_delta { 0 };
    int   merges      { 0 };
};

inline constexpr bool is_power_of_two(int v) { return v > 0 && (v & (v - 1)) == 0; }

/** A valid tile value is a power of two that is at least 2. */
inline constexpr bool is_tile_value(int v) { return v >= 2 && is_power_of_two(v); }

/** Two tiles of value `v` merge into one of value 2v, if it fits in an int. */
inline constexpr bool can_merge(int v) { return is_tile_value(v) && v < MAX_TILE_VALUE; }

std::string to_string(Side);

/**
 * Parse a direction as typed on the console: one of the wasd keys or the
 * full names (up, right, down, left, north, east, south, west).
 */
std::optional<Side> side_from_string(const std::string&);

enum class Output {
    CONSOLE,
    FILE
};

} // namespace g2048

#endif
