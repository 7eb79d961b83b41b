#pragma once

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pairs/core/Game.hpp"

namespace pairs::render {

struct Layout {
    float board_left{};
    float board_top{};
    float tile_width{};
    float tile_height{};
    float tile_inset{};
    float panel_left{};
    float panel_top{};
    float panel_width{};
    float panel_wrap{};
};

struct Color {
    Uint8 r{255};
    Uint8 g{255};
    Uint8 b{255};
    Uint8 a{255};
};

struct Fonts {
    TTF_Font* heading = nullptr;
    TTF_Font* body = nullptr;
    TTF_Font* glyph = nullptr;
};

// Picture faces loaded through SDL_image on first use, one texture per asset
// path. A path that fails to load is remembered and reported once.
class TileFaceCache {
public:
    explicit TileFaceCache(SDL_Renderer* renderer) : renderer_(renderer) {}
    ~TileFaceCache();

    TileFaceCache(const TileFaceCache&) = delete;
    TileFaceCache& operator=(const TileFaceCache&) = delete;

    SDL_Texture* Get(const pairs::core::TileIdentity& identity);
    void Clear();

private:
    SDL_Renderer* renderer_ = nullptr;
    std::map<std::string, SDL_Texture*> textures_;
};

struct BoardRenderData {
    const pairs::core::Game& game;
    std::optional<pairs::core::Cell> hover;
};

struct PanelInfo {
    int pairs_found = 0;
    int pair_count = 0;
    int attempts = 0;
    std::string status;
    std::vector<std::string> controls;
};

Layout ComputeLayout(int window_w,
                     int window_h,
                     int cols,
                     int rows,
                     int panel_width_px = 320,
                     int margin_px = 40);

// Maps a window-space point onto the board drawn with layout.
pairs::core::CellTarget CellFromPoint(const Layout& layout,
                                      const pairs::core::Board& board,
                                      int x,
                                      int y);

Fonts LoadFonts(float scale, float tile_height);
void DestroyFonts(Fonts& fonts);

void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout,
               const Fonts& fonts,
               TileFaceCache& faces);
void DrawPanel(SDL_Renderer* renderer,
               const Layout& layout,
               const Fonts& fonts,
               const PanelInfo& panel);

}  // namespace pairs::render
