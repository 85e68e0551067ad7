#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace skyraid {

/// JSON-backed settings store addressed with dot-separated key paths
/// ("collision.debug_render").  Missing or mistyped keys fall back to the
/// caller's default.
class Config {
public:
    /// Load from a JSON file. Returns false if the file cannot be read or parsed.
    bool loadFromFile(const std::string& path);

    /// Load from a JSON string (used by tests and embedded defaults).
    bool loadFromString(const std::string& jsonStr);

    /// Overlay another JSON file on top of the current data.  Objects merge
    /// recursively, other values replace.  On failure nothing changes.
    bool mergeFromFile(const std::string& path);

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setFloat(const std::string& key, float value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;

    /// Subtree at a key path, or nullptr when absent
    const nlohmann::json* section(const std::string& key) const { return resolve(key); }

    const nlohmann::json& raw() const { return m_data; }

private:
    const nlohmann::json* resolve(const std::string& key) const;
    nlohmann::json& resolveOrCreate(const std::string& key);
    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

/// Settings consumed by the headless simulation driver
struct SimulationSettings {
    std::string logLevel = "info";
    std::string logFile;
    float tickMs = 16.0f;
    int ticks = 180;
    bool debugRender = false;

    static SimulationSettings fromConfig(const Config& config);
};

} // namespace skyraid
