#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_mixer.h>
#include <SDL2/SDL_ttf.h>

#include "pairs/app/ConfigFile.hpp"
#include "pairs/core/Errors.hpp"
#include "pairs/core/Game.hpp"
#include "pairs/platform/AudioSystem.hpp"
#include "pairs/platform/SdlInput.hpp"
#include "pairs/platform/TickClock.hpp"
#include "pairs/render/SceneRenderer.hpp"

using pairs::core::ClickOutcome;
using pairs::core::ConfigurationError;
using pairs::core::Game;
using pairs::core::GameConfig;
using pairs::core::TickOutcome;
using pairs::platform::AudioSystem;
using pairs::platform::InputEventType;
using pairs::platform::KeyCode;
using pairs::platform::MouseButton;
using pairs::platform::SdlInput;
using pairs::platform::TickClock;
using pairs::render::BoardRenderData;
using pairs::render::ComputeLayout;
using pairs::render::DestroyFonts;
using pairs::render::DrawBoard;
using pairs::render::DrawPanel;
using pairs::render::LoadFonts;
using pairs::render::PanelInfo;
using pairs::render::TileFaceCache;
using Fonts = pairs::render::Fonts;
using Layout = pairs::render::Layout;

namespace {

constexpr int kLogicalWidth = 1280;
constexpr int kLogicalHeight = 800;

AudioSystem* g_audio = nullptr;

struct Session {
    std::optional<Game> game;
    Layout layout{};
    std::optional<pairs::core::Cell> hover;
    std::string status;
    int round = 0;
};

float ComputeUiScale(int window_w, int window_h) {
    if (window_w <= 0 || window_h <= 0) {
        return 1.0f;
    }
    const float scale_w = static_cast<float>(window_w) / static_cast<float>(kLogicalWidth);
    const float scale_h = static_cast<float>(window_h) / static_cast<float>(kLogicalHeight);
    return std::clamp(std::min(scale_w, scale_h), 0.6f, 3.0f);
}

void RelayoutSession(Session& session, int window_w, int window_h) {
    if (!session.game) {
        return;
    }
    const float scale = ComputeUiScale(window_w, window_h);
    session.layout = ComputeLayout(window_w, window_h, session.game->board().cols(),
                                   session.game->board().rows(),
                                   static_cast<int>(320.0f * scale),
                                   static_cast<int>(40.0f * scale));
}

void StartRound(Session& session, const GameConfig& config, std::uint32_t seed, int window_w,
                int window_h) {
    session.game.emplace(config, seed);
    session.hover.reset();
    session.status = "Pick a tile";
    ++session.round;
    RelayoutSession(session, window_w, window_h);
    SDL_Log("Round %d: %dx%d board, %d pairs, seed %u", session.round, config.rows, config.cols,
            session.game->pairCount(), seed);
}

void ApplyClickOutcome(Session& session, ClickOutcome outcome) {
    const Game& game = *session.game;
    switch (outcome) {
        case ClickOutcome::Ignored:
            return;
        case ClickOutcome::FirstRevealed:
            session.status = "Pick its partner";
            if (g_audio) {
                g_audio->PlayFlip();
            }
            return;
        case ClickOutcome::PairMatched:
            if (game.IsGameOver()) {
                session.status = "All pairs found in " + std::to_string(game.attempts()) +
                                 " attempts! Press R to play again.";
                SDL_Log("Round %d finished after %d attempts", session.round, game.attempts());
                if (g_audio) {
                    g_audio->PlayWin();
                }
            } else {
                session.status = "Match!";
                if (g_audio) {
                    g_audio->PlayMatch();
                }
            }
            return;
        case ClickOutcome::PairMismatched:
            session.status = "No match";
            if (g_audio) {
                g_audio->PlayMismatch();
            }
            return;
    }
}

void ApplyTickOutcome(Session& session, TickOutcome outcome) {
    if (outcome == TickOutcome::RolledBack || outcome == TickOutcome::Cleared) {
        if (!session.game->IsGameOver()) {
            session.status = "Pick a tile";
        }
    }
}

PanelInfo BuildPanel(const Session& session) {
    PanelInfo panel;
    panel.pairs_found = session.game->pairsFound();
    panel.pair_count = session.game->pairCount();
    panel.attempts = session.game->attempts();
    panel.status = session.status;
    panel.controls = {"Click: flip a tile", "R: new round", "Esc: quit"};
    return panel;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    GameConfig config;
    try {
        config = pairs::app::LoadGameConfig(argc > 1 ? std::filesystem::path(argv[1])
                                                     : std::filesystem::path());
    } catch (const ConfigurationError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid configuration: %s", e.what());
        SDL_Quit();
        return 1;
    }

    const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
    int img_result = IMG_Init(img_flags);
    if ((img_result & img_flags) != img_flags) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "IMG_Init failed: %s", IMG_GetError());
    }

    if (TTF_Init() != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "TTF_Init failed: %s", TTF_GetError());
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    AudioSystem audio;
    if (!audio.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Audio disabled: %s", Mix_GetError());
    } else {
        g_audio = &audio;
    }

    SDL_Window* window = SDL_CreateWindow("PAIRS", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          config.resolution[0], config.resolution[1],
                                          SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        g_audio = nullptr;
        audio.Shutdown();
        TTF_Quit();
        IMG_Quit();
        SDL_Quit();
        return 1;
    }
    SDL_SetWindowMinimumSize(window, 640, 400);

    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        g_audio = nullptr;
        audio.Shutdown();
        TTF_Quit();
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    int window_w = 0;
    int window_h = 0;
    SDL_GetWindowSize(window, &window_w, &window_h);

    Session session;
    try {
        StartRound(session, config, config.seed ? *config.seed : std::random_device{}(), window_w,
                   window_h);
    } catch (const ConfigurationError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot build board: %s", e.what());
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        g_audio = nullptr;
        audio.Shutdown();
        TTF_Quit();
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    Fonts fonts = LoadFonts(ComputeUiScale(window_w, window_h), session.layout.tile_height);
    if (!fonts.heading || !fonts.body || !fonts.glyph) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to load required fonts.");
        DestroyFonts(fonts);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        g_audio = nullptr;
        audio.Shutdown();
        TTF_Quit();
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    std::optional<TileFaceCache> faces;
    faces.emplace(renderer);

    SdlInput input;
    TickClock clock;
    if (!input.Initialize() ||
        !clock.Start(input.tickEventType(), static_cast<Uint32>(config.tick_interval_ms))) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to start the tick clock.");
        faces.reset();
        DestroyFonts(fonts);
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        g_audio = nullptr;
        audio.Shutdown();
        TTF_Quit();
        IMG_Quit();
        SDL_Quit();
        return 1;
    }

    bool running = true;
    while (running) {
        for (const auto& evt : input.Poll()) {
            switch (evt.type) {
                case InputEventType::Quit:
                    running = false;
                    break;
                case InputEventType::Tick:
                    ApplyTickOutcome(session, session.game->Tick(SDL_GetTicks64()));
                    break;
                case InputEventType::MouseMove:
                    session.hover = pairs::render::CellFromPoint(
                        session.layout, session.game->board(), evt.x, evt.y);
                    break;
                case InputEventType::MouseButtonDown: {
                    if (evt.mouse_button != MouseButton::Left) {
                        break;
                    }
                    const auto target = pairs::render::CellFromPoint(
                        session.layout, session.game->board(), evt.x, evt.y);
                    ApplyClickOutcome(session, session.game->Click(target, SDL_GetTicks64()));
                    break;
                }
                case InputEventType::KeyDown:
                    if (evt.key == KeyCode::Escape) {
                        running = false;
                    } else if (evt.key == KeyCode::R) {
                        StartRound(session, config, std::random_device{}(), window_w, window_h);
                    }
                    break;
                case InputEventType::WindowResized: {
                    window_w = evt.width;
                    window_h = evt.height;
                    RelayoutSession(session, window_w, window_h);
                    Fonts resized =
                        LoadFonts(ComputeUiScale(window_w, window_h), session.layout.tile_height);
                    if (resized.heading && resized.body && resized.glyph) {
                        DestroyFonts(fonts);
                        fonts = resized;
                    } else {
                        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                                    "Keeping previous fonts after resize");
                        DestroyFonts(resized);
                    }
                    break;
                }
            }
        }

        SDL_SetRenderDrawColor(renderer, 22, 25, 32, 255);
        SDL_RenderClear(renderer);
        DrawBoard(renderer, BoardRenderData{*session.game, session.hover}, session.layout, fonts,
                  *faces);
        DrawPanel(renderer, session.layout, fonts, BuildPanel(session));
        SDL_RenderPresent(renderer);
    }

    clock.Stop();
    faces.reset();
    DestroyFonts(fonts);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    g_audio = nullptr;
    audio.Shutdown();
    TTF_Quit();
    IMG_Quit();
    SDL_Quit();
    return 0;
}
