#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lb {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines, '#' or ';'
// comments. Keys before the first header land in section "global".
// Parsing is strict: any other non-blank line is an error.
class Config {
public:
    using Section = std::map<std::string, std::string>;

    Config() = default;

    bool Load(const std::string& filename, std::string* error);
    bool LoadFromString(const std::string& iniText, std::string* error);

    const std::string& LoadedFilename() const { return loadedFilename_; }

    bool HasSection(const std::string& section) const;
    std::optional<std::string> Find(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Sections whose name starts with prefix, as (section_name, key->value) pairs
    // in lexical section order.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

    // Dump current settings to INI text.
    std::string DumpIni() const;

private:
    static std::string Trim(const std::string& s);
    bool Parse(std::istream& in, const std::string& origin, std::string* error);

    // map<section, map<key, value>>
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace lb
