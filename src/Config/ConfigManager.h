// src/Config/ConfigManager.h

#pragma once

#include <string>
#include <map>
#include <vector>

// Flat "Section.Key" store backed by an INI file.
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Parse an INI file. On failure the previous values are kept.
    bool LoadConfiguration(const std::string& configFile);

    // Parse INI text directly (used for embedded defaults and tests)
    bool LoadFromString(const std::string& text, const std::string& sourceName = "<memory>");

    // Re-read the last loaded file
    bool ReloadConfiguration();

    bool SaveConfiguration(const std::string& configFile) const;

    std::string GetString(const std::string& key, const std::string& defaultValue = "") const;
    int         GetInt(const std::string& key, int defaultValue = 0) const;
    bool        GetBool(const std::string& key, bool defaultValue = false) const;
    float       GetFloat(const std::string& key, float defaultValue = 0.0f) const;

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetBool(const std::string& key, bool value);
    void SetFloat(const std::string& key, float value);

    bool HasKey(const std::string& key) const;
    void RemoveKey(const std::string& key);
    std::vector<std::string> GetSectionKeys(const std::string& section) const;
    std::vector<std::string> GetAllSections() const;

    const std::string& GetSourceName() const { return m_sourceName; }

private:
    bool Parse(std::istream& in, const std::string& sourceName,
               std::map<std::string, std::string>& out) const;
    bool ValidateConfiguration(const std::map<std::string, std::string>& values) const;

    std::string m_primaryConfigFile;
    std::string m_sourceName;
    std::map<std::string, std::string> m_configValues;
};
