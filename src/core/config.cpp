#include <codeloop/core/config.hpp>
#include <codeloop/core/logger.hpp>
#include <codeloop/core/utils.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace codeloop {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_ERROR("Cannot open config file: %s", path.c_str());
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_string(buffer.str())) {
        LOG_ERROR("Invalid config file: %s", path.c_str());
        return false;
    }
    source_ = path;
    LOG_DEBUG("Loaded config from %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            LOG_ERROR("Config root must be a JSON object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        LOG_ERROR("Config parse error: %s", e.what());
        return false;
    }
}

// A flat key containing dots ("sandbox.timeout": 5) wins over the
// nested path, so both styles work.
const Json* Config::find(const std::string& key) const {
    auto flat = data_.find(key);
    if (flat != data_.end()) {
        return &(*flat);
    }
    const Json* node = &data_;
    for (const auto& part : split(key, ".")) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::ensure(const std::string& key) {
    Json* node = &data_;
    for (const auto& part : split(key, ".")) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* v = find(key);
    return v != nullptr && !v->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || v->is_null()) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        long long parsed = std::strtoll(s.c_str(), &end, 10);
        if (end != s.c_str() && *end == '\0') return parsed;
    }
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        double parsed = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return parsed;
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
        if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    }
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    data_.erase(key);
    ensure(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    data_.erase(key);
    ensure(key) = value;
}

// ============================================================================
// .env loading
// ============================================================================

static std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value[0];
        char last = value[value.size() - 1];
        if ((first == '"' || first == '\'') && first == last) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

int load_env_file(const std::string& path, bool overwrite) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        return -1;
    }

    int count = 0;
    int line_no = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++line_no;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (starts_with(s, "export ")) {
            s = ltrim(s.substr(7));
        }

        size_t eq = s.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("%s:%d: ignoring malformed line", path.c_str(), line_no);
            continue;
        }
        std::string key = rtrim(s.substr(0, eq));
        std::string value = unquote(trim(s.substr(eq + 1)));

        if (!overwrite && std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++count;
        }
    }
    LOG_DEBUG("Loaded %d variable(s) from %s", count, path.c_str());
    return count;
}

std::string get_env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

} // namespace codeloop
