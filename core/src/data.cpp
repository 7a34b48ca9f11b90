#include "data.hpp"
#include "arena.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

std::vector<ObstacleKind> default_obstacle_kinds(){
    return {
        ObstacleKind{"LowCover", 'L', HeightClass::Low,  50, 1.0f,       false, 100},
        ObstacleKind{"HighWall", 'H', HeightClass::High, 100, IMPASSABLE, false, 200},
        ObstacleKind{"Terrain",  'T', HeightClass::None, 20, 1.5f,       false, 50},
        ObstacleKind{"Crate",    'C', HeightClass::Low,  40, 1.0f,       true,  3},
    };
}

static void strip_cr(std::string& s){
    while(!s.empty() && (s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
}

// whole-token numbers; stoi and friends stop at the first junk character
static int to_int(const std::string& tok){
    size_t used=0;
    int v = std::stoi(tok, &used);
    if(used!=tok.size()) throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

static unsigned long to_ulong(const std::string& tok){
    size_t used=0;
    if(!tok.empty() && tok[0]=='-') throw std::invalid_argument("negative value '" + tok + "'");
    unsigned long v = std::stoul(tok, &used);
    if(used!=tok.size()) throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

static float to_float(const std::string& tok){
    size_t used=0;
    float v = std::stof(tok, &used);
    if(used!=tok.size()) throw std::invalid_argument("trailing characters in '" + tok + "'");
    return v;
}

static bool parse_height(const std::string& tok, HeightClass* out){
    if(tok=="None"){ *out=HeightClass::None; return true; }
    if(tok=="Low"){ *out=HeightClass::Low; return true; }
    if(tok=="High"){ *out=HeightClass::High; return true; }
    return false;
}

static bool parse_flag(const std::string& tok, bool* out){
    if(tok=="1" || tok=="true" || tok=="yes"){ *out=true; return true; }
    if(tok=="0" || tok=="false" || tok=="no"){ *out=false; return true; }
    return false;
}

static bool parse_caps(const std::string& tok, uint8_t* out){
    std::stringstream ss(tok); std::string part; uint8_t caps=0;
    while(std::getline(ss,part,'|')){
        if(part=="move") caps|=CAP_MOVE;
        else if(part=="attack") caps|=CAP_ATTACK;
        else if(part=="target") caps|=CAP_TARGET;
        else if(part=="all") caps|=CAP_ALL;
        else if(part=="none") continue;
        else return false;
    }
    *out=caps;
    return true;
}

bool parse_obstacle_kinds(std::istream& in, std::vector<ObstacleKind>& out){
    std::vector<ObstacleKind> kinds;
    std::string line; std::getline(in,line); // header
    int lineno=1;
    while(std::getline(in,line)){
        ++lineno;
        strip_cr(line);
        if(line.empty() || line[0]=='#') continue;
        if(std::count(line.begin(), line.end(), ',')!=6){ std::fprintf(stderr,"obstacles.csv:%d: expected 7 columns\n", lineno); return false; }
        std::stringstream ss(line); std::string tok; ObstacleKind k{};
        try{
            std::getline(ss,k.id,',');
            std::getline(ss,tok,','); if(tok.size()!=1 || tok[0]=='.'){ std::fprintf(stderr,"obstacles.csv:%d: bad glyph '%s'\n", lineno, tok.c_str()); return false; }
            k.glyph=tok[0];
            std::getline(ss,tok,','); if(!parse_height(tok,&k.height)){ std::fprintf(stderr,"obstacles.csv:%d: bad height '%s'\n", lineno, tok.c_str()); return false; }
            std::getline(ss,tok,','); k.cover=to_int(tok);
            std::getline(ss,tok,','); k.move_cost=(tok=="inf") ? IMPASSABLE : to_float(tok);
            std::getline(ss,tok,','); if(!parse_flag(tok,&k.destructible)){ std::fprintf(stderr,"obstacles.csv:%d: bad destructible flag '%s'\n", lineno, tok.c_str()); return false; }
            std::getline(ss,tok,','); k.integrity=to_int(tok);
        }catch(const std::logic_error& ex){
            std::fprintf(stderr,"obstacles.csv:%d: %s\n", lineno, ex.what());
            return false;
        }
        if(k.cover<0 || k.cover>100){ std::fprintf(stderr,"obstacles.csv:%d: cover %d outside 0..100\n", lineno, k.cover); return false; }
        for(const auto& o: kinds){
            if(o.glyph==k.glyph){ std::fprintf(stderr,"obstacles.csv:%d: glyph '%c' used twice\n", lineno, k.glyph); return false; }
        }
        kinds.push_back(k);
    }
    if(kinds.empty()){ std::fprintf(stderr,"obstacles.csv: no obstacle kinds\n"); return false; }
    out.swap(kinds);
    return true;
}

bool load_obstacle_kinds_csv(const std::string& path, std::vector<ObstacleKind>& out){
    std::ifstream f(path);
    if(!f.good()){ std::fprintf(stderr,"Failed to open %s\n", path.c_str()); return false; }
    return parse_obstacle_kinds(f, out);
}

static bool apply_key(ArenaConfig& c, const std::string& key, const std::string& val){
    if(key=="size") c.grid_size=to_int(val);
    else if(key=="diagonal_moves") return parse_flag(val,&c.diagonal_moves);
    else if(key=="diagonal_attacks") return parse_flag(val,&c.diagonal_attacks);
    else if(key=="attack_range") c.attack_range=to_int(val);
    else if(key=="attacks_per_turn") c.attacks_per_turn=to_int(val);
    else if(key=="los_cache") c.los_cache_limit=(size_t)to_ulong(val);
    else if(key=="log") return parse_flag(val,&c.log_events);
    else if(key=="seed") c.seed=(uint32_t)to_ulong(val);
    else if(key=="damage") c.damage.base=to_int(val);
    else if(key=="damage_variation") c.damage.variation=to_int(val);
    else if(key=="min_damage") c.damage.min_damage=to_int(val);
    else if(key=="crit_chance") c.damage.crit_chance=to_int(val);
    else if(key=="crit_multiplier") c.damage.crit_multiplier=to_int(val);
    else if(key=="cover_reduction") c.damage.cover_reduction=to_int(val);
    else return false;
    return true;
}

bool parse_arena(std::istream& in, const std::vector<ObstacleKind>& kinds, ArenaConfig& out){
    enum class Section { Header, Map, Units };
    ArenaConfig cfg;
    Section sec = Section::Header;
    std::string line; int lineno=0; int row=0;
    while(std::getline(in,line)){
        ++lineno;
        strip_cr(line);
        if(line.empty() || line[0]=='#') continue;
        if(line=="map:"){ sec=Section::Map; continue; }
        if(line=="units:"){ sec=Section::Units; continue; }

        try{
            if(sec==Section::Header){
                size_t eq = line.find('=');
                if(eq==std::string::npos || !apply_key(cfg, line.substr(0,eq), line.substr(eq+1))){
                    std::fprintf(stderr,"arena:%d: cannot use '%s'\n", lineno, line.c_str());
                    return false;
                }
            }else if(sec==Section::Map){
                if(row>=cfg.grid_size || (int)line.size()!=cfg.grid_size){
                    std::fprintf(stderr,"arena:%d: map row does not fit a %dx%d grid\n", lineno, cfg.grid_size, cfg.grid_size);
                    return false;
                }
                for(int x=0;x<cfg.grid_size;++x){
                    char ch=line[x];
                    if(ch=='.') continue;
                    auto it = std::find_if(kinds.begin(), kinds.end(), [&](const ObstacleKind& k){ return k.glyph==ch; });
                    if(it==kinds.end()){ std::fprintf(stderr,"arena:%d: unknown glyph '%c'\n", lineno, ch); return false; }
                    cfg.obstacles.push_back(spec_from_kind(*it, GridCoord{x,row}));
                }
                ++row;
            }else{
                if(std::count(line.begin(), line.end(), ',')<2){ std::fprintf(stderr,"arena:%d: expected x,z,team[,caps]\n", lineno); return false; }
                std::stringstream ss(line); std::string tok; UnitSpawn u{};
                std::getline(ss,tok,','); u.pos.x=to_int(tok);
                std::getline(ss,tok,','); u.pos.z=to_int(tok);
                std::getline(ss,tok,',');
                int team=to_int(tok);
                if(team<0 || team>255){ std::fprintf(stderr,"arena:%d: team %d outside 0..255\n", lineno, team); return false; }
                u.team=(TeamId)team;
                tok.clear(); std::getline(ss,tok,',');
                if(tok.empty()) u.caps=CAP_ALL;
                else if(!parse_caps(tok,&u.caps)){ std::fprintf(stderr,"arena:%d: bad capabilities '%s'\n", lineno, tok.c_str()); return false; }
                cfg.units.push_back(u);
            }
        }catch(const std::logic_error& ex){
            std::fprintf(stderr,"arena:%d: %s\n", lineno, ex.what());
            return false;
        }
    }
    if(row!=0 && row!=cfg.grid_size){
        std::fprintf(stderr,"arena: map has %d rows, expected %d\n", row, cfg.grid_size);
        return false;
    }
    out = cfg;
    return true;
}

bool load_arena_txt(const std::string& path, const std::vector<ObstacleKind>& kinds, ArenaConfig& out){
    std::ifstream f(path);
    if(!f.good()){ std::fprintf(stderr,"Failed to open %s\n", path.c_str()); return false; }
    return parse_arena(f, kinds, out);
}

bool load_arena(ArenaConfig& out, const std::string& assets_path){
    std::vector<ObstacleKind> kinds = default_obstacle_kinds();
    std::string kinds_path = assets_path + "/obstacles.csv";
    if(std::ifstream(kinds_path).good()){
        if(!load_obstacle_kinds_csv(kinds_path, kinds)) return false;
    }
    ArenaConfig cfg;
    if(!load_arena_txt(assets_path + "/arena.txt", kinds, cfg)) return false;
    std::string err;
    if(!validate_config(cfg, &err)){
        std::fprintf(stderr,"Invalid arena config: %s\n", err.c_str());
        return false;
    }
    out = cfg;
    return true;
}

static bool fail(std::string* err, const std::string& msg){ if(err) *err=msg; return false; }

static std::string at(GridCoord c){ return "(" + std::to_string(c.x) + "," + std::to_string(c.z) + ")"; }

bool validate_config(const ArenaConfig& cfg, std::string* err){
    if(cfg.grid_size<1 || cfg.grid_size>GRID_SIZE_MAX)
        return fail(err, "grid size must be in 1.." + std::to_string(GRID_SIZE_MAX));
    if(cfg.attack_range<0) return fail(err, "attack range must not be negative");
    if(cfg.attacks_per_turn<0) return fail(err, "attacks per turn must not be negative");
    const DamageRules& d = cfg.damage;
    if(d.base<0 || d.variation<0 || d.min_damage<0) return fail(err, "damage values must not be negative");
    if(d.crit_chance<0 || d.crit_chance>100) return fail(err, "crit chance outside 0..100");
    if(d.crit_multiplier<0) return fail(err, "crit multiplier must not be negative");
    if(d.cover_reduction<0 || d.cover_reduction>100) return fail(err, "cover reduction outside 0..100");

    GridIndex grid(cfg.grid_size);
    std::set<GridCoord> obstacle_tiles, high_tiles, unit_tiles;
    for(const auto& o: cfg.obstacles){
        if(!grid.is_valid(o.pos)) return fail(err, "obstacle off the grid at " + at(o.pos));
        if(o.cover<0 || o.cover>100) return fail(err, "obstacle cover outside 0..100 at " + at(o.pos));
        if(!obstacle_tiles.insert(o.pos).second) return fail(err, "two obstacles on " + at(o.pos));
        if(o.height==HeightClass::High) high_tiles.insert(o.pos);
    }
    for(const auto& u: cfg.units){
        if(!grid.is_valid(u.pos)) return fail(err, "unit off the grid at " + at(u.pos));
        if(!unit_tiles.insert(u.pos).second) return fail(err, "two units on " + at(u.pos));
        if(high_tiles.count(u.pos)) return fail(err, "unit inside a wall at " + at(u.pos));
    }
    return true;
}
