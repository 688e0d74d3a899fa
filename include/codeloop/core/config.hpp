/*
 * codeloop - Configuration
 *
 * JSON configuration addressed with dotted keys ("sandbox.timeout"),
 * plus a small .env loader for credentials kept out of the config file.
 */
#ifndef codeloop_CORE_CONFIG_HPP
#define codeloop_CORE_CONFIG_HPP

#include <codeloop/core/json.hpp>
#include <string>
#include <cstdint>

namespace codeloop {

class Config {
public:
    Config();

    // Load from a JSON file. Returns false (and logs) if the file
    // cannot be read or does not hold a JSON object.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;

    // Creates intermediate objects as needed
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const std::string& source() const { return source_; }
    const Json& raw() const { return data_; }

private:
    const Json* find(const std::string& key) const;
    Json& ensure(const std::string& key);

    Json data_;
    std::string source_;
};

// Read KEY=VALUE lines from `path` into the process environment.
// Blank lines and '#' comments are skipped, an "export " prefix and
// matching surrounding quotes are removed. Existing variables are kept
// unless `overwrite` is set. Returns the number of variables set, or -1
// when the file cannot be opened.
//
// Not thread-safe (setenv); call before starting worker threads.
int load_env_file(const std::string& path, bool overwrite = false);

// getenv() as a std::string; empty when unset
std::string get_env(const char* name);

} // namespace codeloop

#endif // codeloop_CORE_CONFIG_HPP
