#pragma once

#include "card_id.hpp"
#include <istream>
#include <string>
#include <unordered_map>

/// Card ID -> content path (file or folder, relative to the audio folder)
using MappingTable = std::unordered_map<CardId, std::string, CardIdHash>;

/// Parse mapping entries: "<card hex> [label ...] <content path>" per line.
/// Blank lines and '#' comments are skipped.
/// Throws StartupConfigError on malformed or duplicate entries.
MappingTable parse_mapping(std::istream& in, const std::string& source_name = "<mapping>");

/// Load the mapping file at `path`.
/// Throws StartupConfigError if it is missing, unreadable or invalid.
MappingTable load_mapping_file(const std::string& path);
