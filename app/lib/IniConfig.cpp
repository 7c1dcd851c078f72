#include "IniConfig.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <fstream>

bool IniConfig::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    data.clear();
    std::string line;
    std::string section;
    while (std::getline(file, line)) {
        line = Utils::trim_copy(line);
        if (line.empty() || line.front() == ';' || line.front() == '#') {
            continue;
        }
        if (line.front() == '[') {
            const auto close = line.find(']');
            if (close == std::string::npos) {
                continue;
            }
            section = Utils::trim_copy(line.substr(1, close - 1));
            continue;
        }
        const auto equals = line.find('=');
        if (equals == std::string::npos) {
            continue;
        }
        const std::string key = Utils::trim_copy(line.substr(0, equals));
        if (key.empty()) {
            continue;
        }
        data[section][key] = Utils::trim_copy(line.substr(equals + 1));
    }
    return true;
}

bool IniConfig::save(const std::string& path) const
{
    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    bool first = true;
    for (const auto& [section, values] : data) {
        if (!first) {
            file << "\n";
        }
        first = false;
        file << "[" << section << "]\n";
        for (const auto& [key, value] : values) {
            file << key << "=" << value << "\n";
        }
    }
    return static_cast<bool>(file);
}

std::string IniConfig::get_value(const std::string& section,
                                 const std::string& key,
                                 const std::string& default_value) const
{
    const auto section_it = data.find(section);
    if (section_it == data.end()) {
        return default_value;
    }
    const auto it = section_it->second.find(key);
    return it == section_it->second.end() ? default_value : it->second;
}

void IniConfig::set_value(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}

bool IniConfig::has_value(const std::string& section, const std::string& key) const
{
    const auto section_it = data.find(section);
    return section_it != data.end() && section_it->second.count(key) > 0;
}

bool IniConfig::remove_value(const std::string& section, const std::string& key)
{
    const auto section_it = data.find(section);
    if (section_it == data.end()) {
        return false;
    }
    const bool removed = section_it->second.erase(key) > 0;
    if (section_it->second.empty()) {
        data.erase(section_it);
    }
    return removed;
}
