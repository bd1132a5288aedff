#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <string>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

    // Typed lookups return nullopt when the key is missing or does not parse.
    std::optional<std::int64_t> getInt(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
