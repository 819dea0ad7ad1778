// src/Config/ConfigManager.cpp

#include "Config/ConfigManager.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"
#include <fstream>
#include <sstream>
#include <set>

namespace {

struct RangeRule {
    const char* key;
    double      minValue;
    double      maxValue;
};

// Keys that must parse as numbers inside these bounds when present
const RangeRule kRangeRules[] = {
    {"Server.Port",                 1024, 65535},
    {"Server.TickRate",             1,    240},
    {"Server.BroadcastInterval",    1,    60},
    {"Capture.CaptureRate",         0.0,  100.0},
    {"Capture.VictoryPollSeconds",  0.0,  3600.0},
    {"Units.RespawnDelaySeconds",   0.0,  600.0},
    {"Units.InvulnerabilitySeconds",0.0,  60.0},
    {"Vision.CellSize",             0.1,  1000.0},
    {"Vision.FogResendThreshold",   0.0,  1.0},
    {"Commands.RateLimit",          0.1,  1000.0},
    {"Commands.Burst",              1,    1000},
    {"AI.WorkerThreads",            1,    64},
    {"AI.TimeoutMs",                10,   600000},
    {"Network.ReliableResendMs",    10,   10000},
    {"Network.ReliableMaxRetries",  1,    1000},
};

}

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

bool ConfigManager::LoadConfiguration(const std::string& configFile) {
    Logger::Info("Loading configuration file: %s", configFile.c_str());

    std::ifstream file(configFile);
    if (!file.is_open()) {
        Logger::Error("Cannot open configuration file: %s", configFile.c_str());
        return false;
    }

    std::map<std::string, std::string> parsed;
    if (!Parse(file, configFile, parsed)) {
        return false;
    }
    m_primaryConfigFile = configFile;
    m_sourceName = configFile;
    m_configValues = std::move(parsed);
    Logger::Info("Configuration loaded: %zu entries", m_configValues.size());
    return true;
}

bool ConfigManager::LoadFromString(const std::string& text, const std::string& sourceName) {
    std::istringstream in(text);
    std::map<std::string, std::string> parsed;
    if (!Parse(in, sourceName, parsed)) {
        return false;
    }
    m_sourceName = sourceName;
    m_configValues = std::move(parsed);
    return true;
}

bool ConfigManager::ReloadConfiguration() {
    if (m_primaryConfigFile.empty()) {
        Logger::Warn("ConfigManager: nothing to reload");
        return false;
    }
    Logger::Info("Reloading configuration: %s", m_primaryConfigFile.c_str());
    return LoadConfiguration(m_primaryConfigFile);
}

bool ConfigManager::Parse(std::istream& in, const std::string& sourceName,
                          std::map<std::string, std::string>& out) const {
    std::string line;
    std::string currentSection;
    size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        if (auto pos = line.find_first_of("#;"); pos != std::string::npos) {
            line.erase(pos);
        }
        line = StringUtils::Trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = StringUtils::Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            Logger::Warn("%s:%zu: ignoring line without '=': %s",
                         sourceName.c_str(), lineNumber, line.c_str());
            continue;
        }
        std::string key   = StringUtils::Trim(line.substr(0, eq));
        std::string value = StringUtils::Trim(line.substr(eq + 1));
        if (key.empty()) {
            Logger::Warn("%s:%zu: empty key", sourceName.c_str(), lineNumber);
            continue;
        }

        std::string fullKey = currentSection.empty() ? key : (currentSection + "." + key);
        out[fullKey] = value;
        Logger::Trace("Loaded %s = %s", fullKey.c_str(), value.c_str());
    }

    if (!ValidateConfiguration(out)) {
        Logger::Error("Configuration validation failed for %s", sourceName.c_str());
        return false;
    }
    return true;
}

bool ConfigManager::ValidateConfiguration(const std::map<std::string, std::string>& values) const {
    bool ok = true;
    for (const auto& rule : kRangeRules) {
        auto it = values.find(rule.key);
        if (it == values.end()) continue;
        auto number = StringUtils::ToDouble(it->second);
        if (!number) {
            Logger::Error("%s must be numeric (got '%s')", rule.key, it->second.c_str());
            ok = false;
            continue;
        }
        if (*number < rule.minValue || *number > rule.maxValue) {
            Logger::Error("%s must be within %g-%g (got %g)",
                          rule.key, rule.minValue, rule.maxValue, *number);
            ok = false;
        }
    }
    return ok;
}

bool ConfigManager::SaveConfiguration(const std::string& configFile) const {
    Logger::Info("Saving configuration to: %s", configFile.c_str());
    std::ofstream file(configFile);
    if (!file.is_open()) {
        Logger::Error("Cannot open file for write: %s", configFile.c_str());
        return false;
    }

    std::map<std::string, std::map<std::string, std::string>> sections;
    for (auto& [fullKey, val] : m_configValues) {
        if (auto dot = fullKey.find('.'); dot != std::string::npos) {
            sections[fullKey.substr(0, dot)][fullKey.substr(dot + 1)] = val;
        } else {
            sections[""][fullKey] = val;
        }
    }

    file << "# Frontline Server Configuration\n\n";
    for (auto& [sect, kvs] : sections) {
        if (!sect.empty()) {
            file << "[" << sect << "]\n";
        }
        for (auto& [key, val] : kvs) {
            file << key << "=" << val << "\n";
        }
        file << "\n";
    }
    return file.good();
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue) const {
    auto it = m_configValues.find(key);
    if (it != m_configValues.end()) {
        return it->second;
    }
    return defaultValue;
}

int ConfigManager::GetInt(const std::string& key, int defaultValue) const {
    auto s = GetString(key);
    if (s.empty()) return defaultValue;
    auto v = StringUtils::ToInt(s);
    if (!v) {
        Logger::Warn("Invalid int for key '%s': %s", key.c_str(), s.c_str());
        return defaultValue;
    }
    return *v;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    auto s = GetString(key);
    if (s.empty()) return defaultValue;
    auto v = StringUtils::ToBool(s);
    if (!v) {
        Logger::Warn("Invalid bool for key '%s': %s", key.c_str(), s.c_str());
        return defaultValue;
    }
    return *v;
}

float ConfigManager::GetFloat(const std::string& key, float defaultValue) const {
    auto s = GetString(key);
    if (s.empty()) return defaultValue;
    auto v = StringUtils::ToDouble(s);
    if (!v) {
        Logger::Warn("Invalid float for key '%s': %s", key.c_str(), s.c_str());
        return defaultValue;
    }
    return static_cast<float>(*v);
}

void ConfigManager::SetString(const std::string& key, const std::string& value) {
    m_configValues[key] = value;
    Logger::Debug("Config updated: %s = %s", key.c_str(), value.c_str());
}

void ConfigManager::SetInt(const std::string& key, int v)    { SetString(key, std::to_string(v)); }
void ConfigManager::SetBool(const std::string& key, bool v)  { SetString(key, v ? "true" : "false"); }
void ConfigManager::SetFloat(const std::string& key, float v){ SetString(key, std::to_string(v)); }

bool ConfigManager::HasKey(const std::string& key) const {
    return m_configValues.find(key) != m_configValues.end();
}

void ConfigManager::RemoveKey(const std::string& key) {
    if (m_configValues.erase(key)) {
        Logger::Debug("Config key removed: %s", key.c_str());
    }
}

std::vector<std::string> ConfigManager::GetSectionKeys(const std::string& section) const {
    std::vector<std::string> keys;
    std::string prefix = section + ".";
    for (auto& [k, v] : m_configValues) {
        if (k.rfind(prefix, 0) == 0) {
            keys.push_back(k.substr(prefix.size()));
        }
    }
    return keys;
}

std::vector<std::string> ConfigManager::GetAllSections() const {
    std::set<std::string> secs;
    for (auto& [k, v] : m_configValues) {
        if (auto dot = k.find('.'); dot != std::string::npos) {
            secs.insert(k.substr(0, dot));
        }
    }
    return std::vector<std::string>(secs.begin(), secs.end());
}
