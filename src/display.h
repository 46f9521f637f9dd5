#ifndef __G2048_DISPLAY_H_
#define __G2048_DISPLAY_H_

#include <iostream>
#include <string>
#include "types.h"

namespace g2048 {

class Board;
class Model;

namespace display {

template<typename... Args>
inline void PRINT(Args... args) {
    (std::cout << ... << args) << std::endl;
}

/**
 * The board drawn top row first, one `|%4d` slot per cell. In console mode
 * the tiles are colored according to their value.
 */
extern const std::string to_string(const Board& board, Output output_mode = Output::CONSOLE);

/**
 * The board followed by the score line of the model.
 */
extern const std::string to_string(const Model& model, Output output_mode = Output::CONSOLE);

} // namespace display
} // namespace g2048

#endif
