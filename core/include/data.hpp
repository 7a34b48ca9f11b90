#pragma once
#include <istream>
#include <string>
#include <vector>
struct ObstacleKind; struct ArenaConfig;

std::vector<ObstacleKind> default_obstacle_kinds();

bool parse_obstacle_kinds(std::istream& in, std::vector<ObstacleKind>& out);
bool load_obstacle_kinds_csv(const std::string& path, std::vector<ObstacleKind>& out);

bool parse_arena(std::istream& in, const std::vector<ObstacleKind>& kinds, ArenaConfig& out);
bool load_arena_txt(const std::string& path, const std::vector<ObstacleKind>& kinds, ArenaConfig& out);

// <assets>/obstacles.csv (optional, built-in kinds otherwise) + <assets>/arena.txt
bool load_arena(ArenaConfig& out, const std::string& assets_path);

bool validate_config(const ArenaConfig& cfg, std::string* err);
