#ifndef BREACH_DATA_LOADER_H
#define BREACH_DATA_LOADER_H

#include "map_data.h"
#include "match_config.h"
#include <string>

namespace breach {

// JSON documents -> engine data. File IO stays with the caller
// (Godot FileAccess in the extension, string literals in tests).
// Both return false with a message in `error` and leave `out`
// untouched on malformed input.
bool parse_map_json(const std::string &text, MapData &out, std::string &error);
bool parse_match_config_json(const std::string &text, MatchConfig &out,
                             std::string &error);

} // namespace breach

#endif // BREACH_DATA_LOADER_H
