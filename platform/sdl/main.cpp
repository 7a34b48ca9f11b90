#include <SDL.h>
#include <SDL_mixer.h>
#include <cstdio>
#include <string>
#include <vector>
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <SDL_ttf.h>
#include "arena.hpp"
#include "data.hpp"

static void draw_text(SDL_Renderer* ren, TTF_Font* font,
                      const char* text, int x, int y, SDL_Color col);

// --- UI helpers ---
static inline void sdl_fill(SDL_Renderer* r, SDL_Rect rc, Uint8 R, Uint8 G, Uint8 B, Uint8 A){
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, R,G,B,A);
    SDL_RenderFillRect(r, &rc);
}
static inline void sdl_rect(SDL_Renderer* r, SDL_Rect rc, Uint8 R, Uint8 G, Uint8 B, Uint8 A){
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, R,G,B,A);
    SDL_RenderDrawRect(r, &rc);
}

static const int WINDOW_W = 1024;
static const int WINDOW_H = 720;
static const int ISO_W = 128;
static const int ISO_H = 64;
static const int UNIT_W = 28;
static const int UNIT_H = 44;
static const int HP_MAX = 3;
static int ORIGIN_X = WINDOW_W/2;
static int ORIGIN_Y = 140;

// camera pixel offset
static int cam_px = 0;
static int cam_py = 0;

static inline SDL_Point iso_to_screen_px(int tx,int tz){
    int sx = (tx - tz) * (ISO_W/2) - cam_px + ORIGIN_X;
    int sy = (tx + tz) * (ISO_H/2) - cam_py + ORIGIN_Y;
    return {sx, sy};
}
static inline GridCoord screen_px_to_iso(int sx,int sy){
    float fx = (float)(sx + cam_px - ORIGIN_X) / (ISO_W/2);
    float fy = (float)(sy + cam_py - ORIGIN_Y) / (ISO_H/2);
    int tx = (int)std::floor((fx + fy) * 0.5f);
    int tz = (int)std::floor((fy - fx) * 0.5f);
    return {tx, tz};
}
static inline SDL_Point tile_center(GridCoord c){
    SDL_Point p = iso_to_screen_px(c.x, c.z);
    return { p.x, p.y + ISO_H/2 };
}

static inline void draw_iso_tile_outline(SDL_Renderer* r, int tx, int tz){
    SDL_Point p0 = iso_to_screen_px(tx,   tz);
    SDL_Point p1 = iso_to_screen_px(tx+1, tz);
    SDL_Point p2 = iso_to_screen_px(tx+1, tz+1);
    SDL_Point p3 = iso_to_screen_px(tx,   tz+1);
    SDL_RenderDrawLine(r, p0.x, p0.y, p1.x, p1.y);
    SDL_RenderDrawLine(r, p1.x, p1.y, p2.x, p2.y);
    SDL_RenderDrawLine(r, p2.x, p2.y, p3.x, p3.y);
    SDL_RenderDrawLine(r, p3.x, p3.y, p0.x, p0.y);
}

// filled diamond, lifted by 'lift' pixels to fake obstacle height
static void fill_iso_tile(SDL_Renderer* r, int tx, int tz, SDL_Color c, int lift){
    SDL_Point p[4] = { iso_to_screen_px(tx,tz), iso_to_screen_px(tx+1,tz),
                       iso_to_screen_px(tx+1,tz+1), iso_to_screen_px(tx,tz+1) };
    SDL_Vertex v[4];
    for(int i=0;i<4;++i){
        v[i].position = SDL_FPoint{ (float)p[i].x, (float)(p[i].y - lift) };
        v[i].color = c;
        v[i].tex_coord = SDL_FPoint{0,0};
    }
    const int ids[6] = {0,1,2, 0,2,3};
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_RenderGeometry(r, nullptr, v, 4, ids, 6);
    if(lift>0){
        SDL_SetRenderDrawColor(r, c.r/2, c.g/2, c.b/2, 255);
        for(int i=1;i<4;++i) SDL_RenderDrawLine(r, p[i].x, p[i].y, p[i].x, p[i].y - lift);
    }
}

static void draw_text(SDL_Renderer* ren, TTF_Font* font, const char* text, int x, int y, SDL_Color col){
    if(!font || !text) return;
    SDL_Surface* s = TTF_RenderUTF8_Blended(font, text, col);
    if(!s) return;
    SDL_Texture* t = SDL_CreateTextureFromSurface(ren, s);
    SDL_Rect dst{ x, y, s->w, s->h };
    SDL_RenderCopy(ren, t, nullptr, &dst);
    SDL_FreeSurface(s);
    SDL_DestroyTexture(t);
}

static SDL_Color obstacle_color(const Obstacle& o){
    if(o.height==HeightClass::High) return SDL_Color{110,110,120,255};
    if(o.height==HeightClass::Low)  return o.destructible ? SDL_Color{170,120,60,255} : SDL_Color{140,100,60,255};
    return SDL_Color{70,130,70,255};
}
static int obstacle_lift(const Obstacle& o){
    if(o.height==HeightClass::High) return 40;
    if(o.height==HeightClass::Low)  return 14;
    return 0;
}
static SDL_Color team_color(TeamId t){
    return t==0 ? SDL_Color{70,130,230,255} : SDL_Color{230,130,50,255};
}

// --- HUD notice (file-scope, fades out) ---
struct HudNotice {
    std::string text;
    uint32_t show_ms = 0;
    uint32_t dur_ms  = 0;
};

inline void hud_show(HudNotice& h, const std::string& t, uint32_t dur_ms){
    h.text   = t;
    h.show_ms = SDL_GetTicks();
    h.dur_ms  = dur_ms;
}

inline uint8_t hud_alpha(const HudNotice& h, uint32_t now){
    if(h.text.empty() || h.dur_ms==0) return 0;
    uint32_t elapsed = (now >= h.show_ms ? now - h.show_ms : 0);
    if(elapsed >= h.dur_ms) return 0;
    const uint32_t fade_ms = 350;
    if(elapsed > h.dur_ms - fade_ms){
        float t = float(h.dur_ms - elapsed) / float(fade_ms);
        int a = std::clamp(int(220 * t), 0, 220);
        return (uint8_t)a;
    }
    return 220;
}

int main(int argc, char** argv){
    std::string assets = argc>1 ? argv[1] : "assets";

    ArenaConfig cfg;
    if(!load_arena(cfg, assets)){
        std::fprintf(stderr, "Failed to load arena from %s.\n", assets.c_str()); return 3;
    }
    Arena arena(cfg);
    if(!setup_arena(arena)){
        std::fprintf(stderr, "Failed to set up arena.\n"); return 3;
    }
    // the viewer stands in for the external health system
    std::unordered_map<UnitId,int> hp;
    for(UnitId id: arena.units.ids()) hp[id] = HP_MAX;

    if(SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) != 0){
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }
    if(Mix_OpenAudio(44100, AUDIO_S16SYS, 2, 1024) != 0){
        std::fprintf(stderr, "Mix_OpenAudio failed: %s\n", Mix_GetError());
    }
    Mix_Chunk* sfxMove   = Mix_LoadWAV((assets + "/sfx/move.wav").c_str());
    Mix_Chunk* sfxAttack = Mix_LoadWAV((assets + "/sfx/attack.wav").c_str());
    Mix_Chunk* sfxDeny   = Mix_LoadWAV((assets + "/sfx/deny.wav").c_str());
    Mix_Chunk* sfxBreak  = Mix_LoadWAV((assets + "/sfx/break.wav").c_str());

    SDL_Window* win = SDL_CreateWindow("tacgrid - arena",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, WINDOW_W, WINDOW_H, SDL_WINDOW_SHOWN);
    if(!win){
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return 1;
    }
    SDL_Renderer* ren = SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED|SDL_RENDERER_PRESENTVSYNC);

    if (TTF_Init() != 0) {
        std::fprintf(stderr, "TTF_Init failed: %s\n", TTF_GetError());
        return 1;
    }
    TTF_Font* font = TTF_OpenFont((assets + "/DejaVuSans.ttf").c_str(), 14);
    if (!font) {
        std::fprintf(stderr, "TTF_OpenFont failed: %s\n", TTF_GetError());
        // keep running, text just will not be drawn
    }

    bool running=true;
    GridCoord hover{-1,-1};
    UnitId selected = NO_UNIT;
    HudNotice hud{};

    auto play = [](Mix_Chunk* c){ if(c) Mix_PlayChannel(-1, c, 0); };

    while(running){
        SDL_Event e;
        while(SDL_PollEvent(&e)){
            if(e.type==SDL_QUIT) running=false;
            if(e.type==SDL_KEYDOWN){
                SDL_Keycode k = e.key.keysym.sym;
                if(k==SDLK_ESCAPE) selected = NO_UNIT;
                if(k==SDLK_q) running=false;
                if(k==SDLK_a) cam_px -= 24;
                if(k==SDLK_d) cam_px += 24;
                if(k==SDLK_w) cam_py -= 12;
                if(k==SDLK_s) cam_py += 12;
                if(k==SDLK_r){
                    for(UnitId id: arena.units.ids()) arena.units.set_attacks_left(id, arena.cfg.attacks_per_turn);
                    hud_show(hud, "Attacks refilled", 1200);
                }
                if(k==SDLK_c){
                    LosStats st = arena.los.stats();
                    std::printf("[LOS] hits %zu misses %zu entries %zu invalidated %zu\n",
                                st.hits, st.misses, st.entries, st.invalidations);
                    arena.los.clear();
                    hud_show(hud, "LOS cache cleared", 1200);
                }
                if(k==SDLK_x && arena.grid.is_valid(hover)){
                    if(auto u = arena.occupancy.occupant_at(hover)){
                        kill_unit(arena, *u);
                        if(selected==*u) selected = NO_UNIT;
                    }
                }
            }
            if(e.type==SDL_MOUSEMOTION){
                hover = screen_px_to_iso(e.motion.x, e.motion.y);
            }
            if(e.type==SDL_MOUSEBUTTONDOWN){
                GridCoord t = screen_px_to_iso(e.button.x, e.button.y);
                std::optional<UnitId> there;
                if(arena.grid.is_valid(t)) there = arena.occupancy.occupant_at(t);

                if(e.button.button==SDL_BUTTON_LEFT){
                    if(there){
                        selected = *there;
                    }else if(selected!=NO_UNIT){
                        MoveCheck m = order_move(arena, selected, t);
                        if(!m.ok()){
                            hud_show(hud, std::string("Move refused: ") + reason_name(m.reason), 1500);
                            play(sfxDeny);
                        }
                    }
                }
                if(e.button.button==SDL_BUTTON_RIGHT && arena.grid.is_valid(t)){
                    if(there && selected!=NO_UNIT){
                        order_attack(arena, selected, *there);
                    }else if(auto o = arena.obstacles.at(t)){
                        if(damage_obstacle(arena, o->id, 1) < 0){
                            hud_show(hud, "That will not break", 1200);
                            play(sfxDeny);
                        }
                    }
                }
            }
        }

        // consume core notifications
        for(const Event& ev: arena.events.drain()){
            switch(ev.kind){
                case EventKind::UnitMoved:
                    play(sfxMove);
                    break;
                case EventKind::ObstacleDestroyed:
                    play(sfxBreak);
                    hud_show(hud, "Obstacle destroyed", 1500);
                    break;
                case EventKind::AttackResolved:
                    if(ev.reason!=Reason::Ok){
                        hud_show(hud, std::string("Attack refused: ") + reason_name(ev.reason), 1500);
                        play(sfxDeny);
                        break;
                    }
                    play(sfxAttack);
                    hp[ev.target] -= ev.amount;
                    {
                        char buf[96];
                        std::snprintf(buf, sizeof(buf), "Hit for %d (cover %d%%)", ev.amount, ev.cover);
                        hud_show(hud, buf, 1500);
                    }
                    if(hp[ev.target] <= 0){
                        std::printf("[DEATH] unit %u\n", ev.target);
                        kill_unit(arena, ev.target);
                        if(selected==ev.target) selected = NO_UNIT;
                    }
                    break;
                default:
                    break;
            }
        }

        SDL_SetRenderDrawColor(ren, 18,20,28,255);
        SDL_RenderClear(ren);

        const int N = arena.grid.size();
        std::vector<GridCoord> moves, sight;
        std::vector<UnitId> targets;
        if(selected!=NO_UNIT){
            moves = arena.movement.valid_moves(selected);
            targets = arena.combat.valid_targets(selected);
            if(auto p = arena.occupancy.position_of(selected)) sight = arena.los.visible_from(*p);
        }

        // ground
        for(int z=0; z<N; ++z) for(int x=0; x<N; ++x){
            GridCoord c{x,z};
            bool seen = selected==NO_UNIT || std::find(sight.begin(), sight.end(), c)!=sight.end();
            Uint8 g = seen ? 60 : 34;
            fill_iso_tile(ren, x, z, SDL_Color{g, (Uint8)(g+16), g, 255}, 0);
            SDL_SetRenderDrawColor(ren, 90,100,110,255);
            draw_iso_tile_outline(ren, x, z);
        }
        SDL_SetRenderDrawColor(ren, 80,220,230,255);
        for(GridCoord m: moves) draw_iso_tile_outline(ren, m.x, m.z);

        // obstacles and units, back to front
        for(int d=0; d<2*N-1; ++d) for(int x=0; x<N; ++x){
            int z = d - x;
            if(z<0 || z>=N) continue;
            GridCoord c{x,z};
            if(auto o = arena.obstacles.at(c)){
                fill_iso_tile(ren, x, z, obstacle_color(*o), obstacle_lift(*o));
                if(o->destructible && font){
                    char buf[16]; std::snprintf(buf, sizeof(buf), "%d", o->integrity);
                    SDL_Point p = tile_center(c);
                    draw_text(ren, font, buf, p.x-4, p.y-obstacle_lift(*o)-8, SDL_Color{240,230,200,255});
                }
            }
            if(auto u = arena.occupancy.occupant_at(c)){
                auto st = arena.units.find(*u);
                SDL_Point p = tile_center(c);
                SDL_Rect body{ p.x-UNIT_W/2, p.y-UNIT_H+6, UNIT_W, UNIT_H };
                SDL_Color col = team_color(st ? st->team : 0);
                sdl_fill(ren, body, col.r, col.g, col.b, 255);
                if(*u==selected) sdl_rect(ren, SDL_Rect{body.x-2, body.y-2, body.w+4, body.h+4}, 255,255,255,255);
                else if(std::find(targets.begin(), targets.end(), *u)!=targets.end())
                    sdl_rect(ren, SDL_Rect{body.x-2, body.y-2, body.w+4, body.h+4}, 230,60,60,255);
                SDL_Rect bar{ body.x, body.y-8, UNIT_W, 4 };
                sdl_fill(ren, bar, 40,20,20,220);
                bar.w = UNIT_W * std::max(0, hp[*u]) / HP_MAX;
                sdl_fill(ren, bar, 80,200,80,240);
            }
        }

        // line of sight from the selected unit to the hovered tile
        std::string losLine;
        if(selected!=NO_UNIT && arena.grid.is_valid(hover)){
            if(auto from = arena.occupancy.position_of(selected)){
                LosResult r = arena.los.query(*from, hover);
                SDL_Point a = tile_center(*from), b = tile_center(hover);
                if(r.visible) SDL_SetRenderDrawColor(ren, 120,240,120,255);
                else          SDL_SetRenderDrawColor(ren, 240,80,80,255);
                SDL_RenderDrawLine(ren, a.x, a.y-20, b.x, b.y-20);
                char buf[96];
                if(r.visible) std::snprintf(buf, sizeof(buf), "LOS clear, cover %d%%", r.cover);
                else          std::snprintf(buf, sizeof(buf), "LOS blocked by obstacle %u", r.blocker.value_or(0));
                losLine = buf;
            }
        }

        // top bar
        SDL_Rect topbar{0,0,WINDOW_W,32};
        sdl_fill(ren, topbar, 26,30,40,230);
        if(font){
            char buf[160];
            if(selected!=NO_UNIT){
                auto st = arena.units.find(selected);
                std::snprintf(buf, sizeof(buf), "Unit %u  team %d  attacks %d  moves %zu  targets %zu",
                              selected, st ? st->team : 0, st ? st->attacks_left : 0, moves.size(), targets.size());
            }else{
                std::snprintf(buf, sizeof(buf), "LMB select/move   RMB attack/hit obstacle   R refill   X kill   C clear LOS cache");
            }
            draw_text(ren, font, buf, 10, 8, SDL_Color{220,220,230,255});
            if(!losLine.empty()) draw_text(ren, font, losLine.c_str(), 10, WINDOW_H-28, SDL_Color{220,220,230,255});

            uint8_t a = hud_alpha(hud, SDL_GetTicks());
            if(a>0) draw_text(ren, font, hud.text.c_str(), WINDOW_W/2-80, 44, SDL_Color{255,240,180,a});
        }

        SDL_RenderPresent(ren);
    }

    if (font) TTF_CloseFont(font);
    TTF_Quit();
    if (sfxMove) Mix_FreeChunk(sfxMove);
    if (sfxAttack) Mix_FreeChunk(sfxAttack);
    if (sfxDeny) Mix_FreeChunk(sfxDeny);
    if (sfxBreak) Mix_FreeChunk(sfxBreak);
    Mix_CloseAudio();
    SDL_DestroyRenderer(ren);
    SDL_DestroyWindow(win);
    SDL_Quit();
    return 0;
}
