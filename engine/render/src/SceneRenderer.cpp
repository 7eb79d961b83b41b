#include "pairs/render/SceneRenderer.hpp"

#include <SDL2/SDL_image.h>

#include <algorithm>
#include <cmath>
#include <filesystem>

#include "pairs/app/AssetFS.hpp"
#include "pairs/core/InputMapper.hpp"

namespace pairs::render {

namespace {

constexpr Color kBackgroundHidden{58, 66, 84, 255};
constexpr Color kBackgroundRevealed{236, 239, 244, 255};
constexpr Color kGlyphColor{34, 40, 52, 255};
constexpr Color kHoverOutline{255, 255, 255, 140};
constexpr Color kPendingOutline{255, 207, 65, 255};
constexpr Color kMismatchOutline{238, 84, 76, 255};

TTF_Font* LoadFontFromCandidates(const std::vector<std::filesystem::path>& candidates,
                                 int point_size) {
    for (const auto& candidate : candidates) {
        if (!pairs::app::FileExists(candidate)) {
            continue;
        }
        TTF_Font* font = TTF_OpenFont(candidate.string().c_str(), point_size);
        if (font) {
            TTF_SetFontHinting(font, TTF_HINTING_LIGHT);
            return font;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "TTF_OpenFont(%s) failed: %s",
                    candidate.string().c_str(), TTF_GetError());
    }
    return nullptr;
}

int ScaledFontSize(int base_size, float scale) {
    int scaled = static_cast<int>(std::lround(static_cast<double>(base_size) * scale));
    if (scaled <= 0) {
        scaled = base_size;
    }
    return std::max(12, scaled);
}

SDL_Color ToSdl(Color color) {
    return SDL_Color{color.r, color.g, color.b, color.a};
}

void SetDrawColor(SDL_Renderer* renderer, Color color) {
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

SDL_FRect TileRect(const Layout& layout, int row, int col) {
    return SDL_FRect{layout.board_left + col * layout.tile_width + layout.tile_inset,
                     layout.board_top + row * layout.tile_height + layout.tile_inset,
                     layout.tile_width - 2.0f * layout.tile_inset,
                     layout.tile_height - 2.0f * layout.tile_inset};
}

int RenderTextLine(SDL_Renderer* renderer,
                   TTF_Font* font,
                   int x,
                   int y,
                   const std::string& text,
                   SDL_Color color) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    int height = surface->h;
    if (texture) {
        SDL_Rect dst{x, y, surface->w, surface->h};
        SDL_RenderCopy(renderer, texture, nullptr, &dst);
        SDL_DestroyTexture(texture);
    }
    SDL_FreeSurface(surface);
    return height;
}

int RenderWrappedText(SDL_Renderer* renderer,
                      TTF_Font* font,
                      int x,
                      int y,
                      const std::string& text,
                      SDL_Color color,
                      int wrap_width) {
    if (!font || text.empty()) {
        return 0;
    }
    SDL_Surface* surface =
        TTF_RenderUTF8_Blended_Wrapped(font, text.c_str(), color, static_cast<Uint32>(wrap_width));
    if (!surface) {
        return 0;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    int height = surface->h;
    if (texture) {
        SDL_Rect dst{x, y, surface->w, surface->h};
        SDL_RenderCopy(renderer, texture, nullptr, &dst);
        SDL_DestroyTexture(texture);
    }
    SDL_FreeSurface(surface);
    return height;
}

void RenderTextCentered(SDL_Renderer* renderer,
                        TTF_Font* font,
                        const SDL_FRect& box,
                        const std::string& text,
                        SDL_Color color) {
    if (!font || text.empty()) {
        return;
    }
    SDL_Surface* surface = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surface) {
        return;
    }
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, surface);
    if (texture) {
        const float scale = std::min({1.0f, box.w / static_cast<float>(surface->w),
                                      box.h / static_cast<float>(surface->h)});
        const float w = surface->w * scale;
        const float h = surface->h * scale;
        SDL_FRect dst{box.x + (box.w - w) * 0.5f, box.y + (box.h - h) * 0.5f, w, h};
        SDL_RenderCopyF(renderer, texture, nullptr, &dst);
        SDL_DestroyTexture(texture);
    }
    SDL_FreeSurface(surface);
}

void DrawPicture(SDL_Renderer* renderer, SDL_Texture* texture, const SDL_FRect& box) {
    int tex_w = 0;
    int tex_h = 0;
    if (SDL_QueryTexture(texture, nullptr, nullptr, &tex_w, &tex_h) != 0 || tex_w <= 0 ||
        tex_h <= 0) {
        return;
    }
    const float scale =
        std::min(box.w / static_cast<float>(tex_w), box.h / static_cast<float>(tex_h));
    const float w = tex_w * scale;
    const float h = tex_h * scale;
    SDL_FRect dst{box.x + (box.w - w) * 0.5f, box.y + (box.h - h) * 0.5f, w, h};
    SDL_RenderCopyF(renderer, texture, nullptr, &dst);
}

void DrawOutline(SDL_Renderer* renderer, SDL_FRect rect, Color color, int thickness) {
    SetDrawColor(renderer, color);
    for (int i = 0; i < thickness; ++i) {
        SDL_RenderDrawRectF(renderer, &rect);
        rect.x += 1.0f;
        rect.y += 1.0f;
        rect.w -= 2.0f;
        rect.h -= 2.0f;
    }
}

}  // namespace

TileFaceCache::~TileFaceCache() {
    Clear();
}

SDL_Texture* TileFaceCache::Get(const pairs::core::TileIdentity& identity) {
    if (!identity.isPicture() || !renderer_) {
        return nullptr;
    }
    auto it = textures_.find(identity.value);
    if (it != textures_.end()) {
        return it->second;
    }
    SDL_Texture* texture = nullptr;
    std::filesystem::path path = pairs::app::AssetPath(identity.value);
    if (pairs::app::FileExists(path)) {
        texture = IMG_LoadTexture(renderer_, path.string().c_str());
        if (!texture) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load tile picture %s: %s",
                        path.string().c_str(), IMG_GetError());
        }
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Tile picture %s not found",
                    identity.value.c_str());
    }
    textures_.emplace(identity.value, texture);
    return texture;
}

void TileFaceCache::Clear() {
    for (auto& entry : textures_) {
        if (entry.second) {
            SDL_DestroyTexture(entry.second);
        }
    }
    textures_.clear();
}

Layout ComputeLayout(int window_w,
                     int window_h,
                     int cols,
                     int rows,
                     int panel_width_px,
                     int margin_px) {
    const float width = static_cast<float>(window_w);
    const float height = static_cast<float>(window_h);

    const float margin =
        std::max(static_cast<float>(margin_px), std::min(width, height) * 0.025f);
    const float panel_width = std::max(static_cast<float>(panel_width_px), width * 0.22f);

    const float available_width = std::max(0.0f, width - panel_width - margin * 3.0f);
    const float available_height = std::max(0.0f, height - margin * 2.0f);
    float tile_size = 0.0f;
    if (cols > 0 && rows > 0) {
        tile_size = std::min(available_width / cols, available_height / rows);
    }

    Layout layout{};
    layout.board_left = margin + (available_width - tile_size * cols) * 0.5f;
    layout.board_top = margin + (available_height - tile_size * rows) * 0.5f;
    layout.tile_width = tile_size;
    layout.tile_height = tile_size;
    layout.tile_inset = std::max(2.0f, tile_size * 0.05f);
    layout.panel_left = margin * 2.0f + available_width;
    layout.panel_top = margin;
    layout.panel_width = panel_width;
    layout.panel_wrap = panel_width - std::max(24.0f, panel_width * 0.08f);
    return layout;
}

pairs::core::CellTarget CellFromPoint(const Layout& layout,
                                      const pairs::core::Board& board,
                                      int x,
                                      int y) {
    const float rel_x = static_cast<float>(x) - layout.board_left;
    const float rel_y = static_cast<float>(y) - layout.board_top;
    return pairs::core::ResolveClick(rel_x, rel_y, layout.tile_width, layout.tile_height, board)
        .target();
}

Fonts LoadFonts(float scale, float tile_height) {
    std::vector<std::filesystem::path> search_paths = {
        pairs::app::AssetPath("fonts/DejaVuSans.ttf"),
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/Library/Fonts/Arial.ttf",
        "C:/Windows/Fonts/segoeui.ttf",
    };

    Fonts fonts;
    fonts.heading = LoadFontFromCandidates(search_paths, ScaledFontSize(28, scale));
    fonts.body = LoadFontFromCandidates(search_paths, ScaledFontSize(20, scale));
    const int glyph_size = std::max(12, static_cast<int>(tile_height * 0.5f));
    fonts.glyph = LoadFontFromCandidates(search_paths, glyph_size);
    return fonts;
}

void DestroyFonts(Fonts& fonts) {
    if (fonts.heading) {
        TTF_CloseFont(fonts.heading);
        fonts.heading = nullptr;
    }
    if (fonts.body) {
        TTF_CloseFont(fonts.body);
        fonts.body = nullptr;
    }
    if (fonts.glyph) {
        TTF_CloseFont(fonts.glyph);
        fonts.glyph = nullptr;
    }
}

void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout,
               const Fonts& fonts,
               TileFaceCache& faces) {
    const auto& board = board_data.game.board();
    const auto& selection = board_data.game.selection();
    const bool mismatch = selection.phase() == pairs::core::TurnPhase::PairMismatched;
    const int outline = std::max(2, static_cast<int>(layout.tile_inset * 0.6f));

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            const pairs::core::Cell cell{col, row};
            const auto& tile = board.tileAt(row, col);
            const SDL_FRect rect = TileRect(layout, row, col);

            if (!tile.revealed) {
                SetDrawColor(renderer, kBackgroundHidden);
                SDL_RenderFillRectF(renderer, &rect);
                if (board_data.hover && *board_data.hover == cell && selection.acceptsClicks()) {
                    DrawOutline(renderer, rect, kHoverOutline, outline);
                }
                continue;
            }

            SetDrawColor(renderer, kBackgroundRevealed);
            SDL_RenderFillRectF(renderer, &rect);

            const float pad = layout.tile_inset;
            const SDL_FRect face{rect.x + pad, rect.y + pad, rect.w - 2.0f * pad,
                                 rect.h - 2.0f * pad};
            if (SDL_Texture* picture = faces.Get(tile.identity)) {
                DrawPicture(renderer, picture, face);
            } else {
                RenderTextCentered(renderer, fonts.glyph, face, tile.identity.label(),
                                   ToSdl(kGlyphColor));
            }

            const bool pending = selection.pendingFirst() == cell || selection.pendingSecond() == cell;
            if (pending) {
                DrawOutline(renderer, rect, mismatch ? kMismatchOutline : kPendingOutline, outline);
            }
        }
    }
}

void DrawPanel(SDL_Renderer* renderer,
               const Layout& layout,
               const Fonts& fonts,
               const PanelInfo& panel) {
    const SDL_Color heading_color{210, 215, 225, 255};
    const SDL_Color value_color{235, 240, 245, 255};
    const SDL_Color detail_color{170, 180, 190, 255};

    TTF_Font* heading_font = fonts.heading ? fonts.heading : fonts.body;
    TTF_Font* body_font = fonts.body ? fonts.body : fonts.heading;

    const int x = static_cast<int>(layout.panel_left);
    int y = static_cast<int>(layout.panel_top);
    const int wrap_width = std::max(40, static_cast<int>(layout.panel_wrap));

    auto add_line = [&](TTF_Font* font, const std::string& text, SDL_Color color, int spacing) {
        if (!font || text.empty()) {
            return;
        }
        y += RenderTextLine(renderer, font, x, y, text, color) + spacing;
    };

    add_line(heading_font, "PAIRS", heading_color, 18);
    add_line(body_font,
             "Found: " + std::to_string(panel.pairs_found) + " / " +
                 std::to_string(panel.pair_count),
             value_color, 8);
    add_line(body_font, "Attempts: " + std::to_string(panel.attempts), value_color, 20);

    add_line(heading_font, "Status:", heading_color, 6);
    if (body_font) {
        const std::string status = panel.status.empty() ? "Pick a tile" : panel.status;
        y += RenderWrappedText(renderer, body_font, x, y, status, value_color, wrap_width) + 20;
    }

    add_line(heading_font, "Controls:", heading_color, 6);
    for (const auto& line : panel.controls) {
        if (!body_font) {
            break;
        }
        y += RenderWrappedText(renderer, body_font, x, y, line, detail_color, wrap_width) + 6;
    }
}

}  // namespace pairs::render
