#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <map>
#include <string>

class IniConfig {
public:
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    std::string get_value(const std::string& section,
                          const std::string& key,
                          const std::string& default_value = "") const;
    void set_value(const std::string& section, const std::string& key, const std::string& value);
    bool has_value(const std::string& section, const std::string& key) const;
    bool remove_value(const std::string& section, const std::string& key);
    bool empty() const { return data.empty(); }

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
