#pragma once

#include "pairs/core/Board.hpp"
#include "pairs/core/Types.hpp"

namespace pairs::core {

struct ClickResolution {
    bool on_board = false;
    int row = 0;
    int col = 0;

    CellTarget target() const {
        if (!on_board) {
            return std::nullopt;
        }
        return Cell{col, row};
    }
};

// pixel_x / pixel_y are relative to the board's top-left corner.
ClickResolution ResolveClick(float pixel_x,
                             float pixel_y,
                             float tile_width,
                             float tile_height,
                             const Board& board);

}  // namespace pairs::core
