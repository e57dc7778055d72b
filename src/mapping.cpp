#include "mapping.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

MappingTable parse_mapping(std::istream& in, const std::string& source_name) {
    MappingTable table;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream iss(line);
        std::vector<std::string> fields;
        std::string field;
        while (iss >> field) fields.push_back(field);

        if (fields.empty() || fields[0][0] == '#') continue;

        std::ostringstream where;
        where << source_name << ":" << line_no << ": ";

        if (fields.size() < 2) {
            throw StartupConfigError(where.str() + "expected '<card id> <path>', got '" + line + "'");
        }

        CardId id;
        try {
            id = parse_card_id(fields.front());
        } catch (const std::invalid_argument& e) {
            throw StartupConfigError(where.str() + e.what());
        }

        // Fields between the id and the path are labels
        if (!table.emplace(id, fields.back()).second) {
            throw StartupConfigError(where.str() + "duplicate card id " + id.to_hex());
        }
    }

    if (in.bad()) {
        throw StartupConfigError("Failed to read " + source_name);
    }
    return table;
}

MappingTable load_mapping_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw StartupConfigError("Mapping file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw StartupConfigError("Cannot open mapping file " + path + ": " + std::strerror(errno));
    }

    auto table = parse_mapping(file, path);
    RFID_LOG_INFO("Loaded " << table.size() << " card mapping(s) from " << path);
    return table;
}
