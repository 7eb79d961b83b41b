#include "pairs/core/InputMapper.hpp"

#include <cmath>

namespace pairs::core {

ClickResolution ResolveClick(float pixel_x,
                             float pixel_y,
                             float tile_width,
                             float tile_height,
                             const Board& board) {
    ClickResolution result;
    if (!std::isfinite(pixel_x) || !std::isfinite(pixel_y) || !std::isfinite(tile_width) ||
        !std::isfinite(tile_height)) {
        return result;
    }
    if (tile_width <= 0.0f || tile_height <= 0.0f) {
        return result;
    }
    if (pixel_x < 0.0f || pixel_y < 0.0f) {
        return result;
    }
    // Bounds are checked before narrowing; the quotient may not fit an int.
    const float col_index = std::floor(pixel_x / tile_width);
    const float row_index = std::floor(pixel_y / tile_height);
    if (!(col_index < static_cast<float>(board.cols())) ||
        !(row_index < static_cast<float>(board.rows()))) {
        return result;
    }
    const int col = static_cast<int>(col_index);
    const int row = static_cast<int>(row_index);
    if (!board.inBounds(row, col)) {
        return result;
    }
    result.on_board = true;
    result.row = row;
    result.col = col;
    return result;
}

}  // namespace pairs::core
