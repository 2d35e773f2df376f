#include "util/env_config.hpp"
#include "util/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace
{
    std::string trim(const std::string &s)
    {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::string unquote(std::string value)
    {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }
}

bool load_env_file(const std::string &filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        file.open("backend/" + filepath);
        if (!file.is_open()) return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq_pos));
        const std::string value = unquote(trim(line.substr(eq_pos + 1)));
        if (key.empty()) continue;

        setenv(key.c_str(), value.c_str(), 0);
    }
    return true;
}

std::string env_string(const char *key, const std::string &fallback)
{
    const char *v = std::getenv(key);
    if (v == nullptr || *v == '\0') return fallback;
    return trim(v);
}

std::string env_required(const char *key)
{
    std::string v = env_string(key);
    if (v.empty()) {
        throw ConfigError(std::string(key) + " is required");
    }
    return v;
}

long long env_int(const char *key, long long fallback, long long min_value, long long max_value)
{
    const std::string raw = env_string(key);
    if (raw.empty()) return fallback;

    long long v = 0;
    std::size_t used = 0;
    try {
        v = std::stoll(raw, &used);
    } catch (const std::exception &) {
        throw ConfigError(std::string(key) + " must be an integer, got '" + raw + "'");
    }
    if (used != raw.size()) {
        throw ConfigError(std::string(key) + " must be an integer, got '" + raw + "'");
    }
    if (v < min_value || v > max_value) {
        std::ostringstream os;
        os << key << "=" << v << " out of range [" << min_value << ", " << max_value << "]";
        throw ConfigError(os.str());
    }
    return v;
}

std::vector<std::string> split_list(const std::string &csv)
{
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

std::vector<std::string> env_list(const char *key, const std::vector<std::string> &fallback)
{
    const std::string raw = env_string(key);
    if (raw.empty()) return fallback;
    return split_list(raw);
}
