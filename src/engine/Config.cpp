#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace skyraid {

namespace {

/// Split "a.b.c" into its path segments; an empty key yields one empty segment
std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> segments;
    size_t start = 0;
    for (;;) {
        size_t dot = key.find('.', start);
        segments.push_back(key.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

bool parseDocument(std::istream& in, const std::string& origin, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: {} is not valid JSON: {}", origin, e.what());
        return false;
    }
    return true;
}

} // namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_WARN("Config: cannot open '{}'", path);
        return false;
    }
    nlohmann::json doc;
    if (!parseDocument(in, "'" + path + "'", doc)) {
        return false;
    }
    m_data = std::move(doc);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream in(jsonStr);
    nlohmann::json doc;
    if (!parseDocument(in, "inline document", doc)) {
        return false;
    }
    m_data = std::move(doc);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return false;
    }
    nlohmann::json overlay;
    if (!parseDocument(in, "overlay '" + path + "'", overlay)) {
        return false;
    }

    // Work on a copy so a throwing merge leaves the loaded data intact
    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data.swap(merged);
    return true;
}

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* node = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!node->is_object()) return nullptr;
        auto found = node->find(segment);
        if (found == node->end()) return nullptr;
        node = &*found;
    }
    return node;
}

nlohmann::json& Config::resolveOrCreate(const std::string& key) {
    nlohmann::json* node = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!node->is_object()) {
            if (!node->is_null()) {
                LOG_WARN("Config: replacing non-object value while setting '{}'", key);
            }
            *node = nlohmann::json::object();
        }
        node = &(*node)[segment];
    }
    return *node;
}

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* node = resolve(key);
    return (node && node->is_string()) ? node->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* node = resolve(key);
    return (node && node->is_number_integer()) ? node->get<int>() : defaultVal;
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* node = resolve(key);
    return (node && node->is_number()) ? node->get<float>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* node = resolve(key);
    return (node && node->is_boolean()) ? node->get<bool>() : defaultVal;
}

void Config::setString(const std::string& key, const std::string& value) { resolveOrCreate(key) = value; }
void Config::setInt(const std::string& key, int value) { resolveOrCreate(key) = value; }
void Config::setFloat(const std::string& key, float value) { resolveOrCreate(key) = value; }
void Config::setBool(const std::string& key, bool value) { resolveOrCreate(key) = value; }

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        base = overlay;
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (const auto& item : overlay.items()) {
        auto existing = base.find(item.key());
        if (item.value().is_object() && existing != base.end() && existing->is_object()) {
            mergeJson(*existing, item.value());
        } else {
            base[item.key()] = item.value();
        }
    }
}

SimulationSettings SimulationSettings::fromConfig(const Config& config) {
    SimulationSettings s;
    s.logLevel    = config.getString("log.level", s.logLevel);
    s.logFile     = config.getString("log.file", s.logFile);
    s.tickMs      = config.getFloat("simulation.tick_ms", s.tickMs);
    s.ticks       = config.getInt("simulation.ticks", s.ticks);
    s.debugRender = config.getBool("collision.debug_render", s.debugRender);

    if (s.tickMs <= 0.0f) {
        LOG_WARN("Config: simulation.tick_ms must be positive, using 16");
        s.tickMs = 16.0f;
    }
    if (s.ticks < 0) {
        LOG_WARN("Config: simulation.ticks must not be negative, using 0");
        s.ticks = 0;
    }
    return s;
}

} // namespace skyraid
