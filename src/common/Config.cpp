#include "lb/common/Config.h"
#include "lb/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace lb {
namespace common {

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::Load(const std::string& filename, std::string* error) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        *error = "cannot open config file: " + filename;
        return false;
    }
    if (!Parse(file, filename, error)) return false;
    loadedFilename_ = filename;
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText, std::string* error) {
    std::istringstream in(iniText);
    return Parse(in, "<string>", error);
}

bool Config::Parse(std::istream& in, const std::string& origin, std::string* error) {
    std::map<std::string, Section> parsed;
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                *error = origin + ":" + std::to_string(lineNo) + ": malformed section header '" + line + "'";
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            if (section.empty()) {
                *error = origin + ":" + std::to_string(lineNo) + ": empty section name";
                return false;
            }
            parsed[section]; // keep empty sections visible
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            *error = origin + ":" + std::to_string(lineNo) + ": expected 'key = value', got '" + line + "'";
            return false;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (key.empty()) {
            *error = origin + ":" + std::to_string(lineNo) + ": empty key";
            return false;
        }
        // Trailing comments are allowed after whitespace: "port = 80 ; note"
        for (const char mark : {';', '#'}) {
            const size_t pos = value.find(std::string(" ") + mark);
            if (pos != std::string::npos) value = Trim(value.substr(0, pos));
        }
        parsed[section][key] = value;
    }

    settings_ = std::move(parsed);
    return true;
}

bool Config::HasSection(const std::string& section) const {
    return settings_.count(section) != 0;
}

std::optional<std::string> Config::Find(const std::string& section, const std::string& key) const {
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return std::nullopt;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return std::nullopt;
    return kit->second;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    auto v = Find(section, key);
    return v ? *v : defaultVal;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<std::pair<std::string, Section>> out;
    for (const auto& kv : settings_) {
        const auto& section = kv.first;
        if (section.rfind(prefix, 0) != 0) continue;
        out.push_back({section, kv.second});
    }
    return out;
}

std::string Config::DumpIni() const {
    std::ostringstream f;
    auto writeSection = [&](const std::string& section, const Section& kv) {
        f << "[" << section << "]\n";
        for (const auto& it : kv) {
            f << it.first << " = " << it.second << "\n";
        }
        f << "\n";
    };

    auto itg = settings_.find("global");
    if (itg != settings_.end()) {
        writeSection("global", itg->second);
    }
    for (const auto& s : settings_) {
        if (s.first == "global") continue;
        writeSection(s.first, s.second);
    }
    return f.str();
}

} // namespace common
} // namespace lb
