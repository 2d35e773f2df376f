#pragma once
#include <string>
#include <vector>

// Load KEY=VALUE lines from a .env file into the process environment.
// Variables already set in the environment are left alone.
// Returns false when neither `filepath` nor backend/`filepath` exists.
bool load_env_file(const std::string &filepath = ".env");

// Typed getters. A set-but-malformed value throws ConfigError.
std::string env_string(const char *key, const std::string &fallback = "");
std::string env_required(const char *key);
long long env_int(const char *key, long long fallback, long long min_value, long long max_value);

// Comma separated list, entries trimmed, empty entries dropped.
std::vector<std::string> env_list(const char *key, const std::vector<std::string> &fallback = {});
std::vector<std::string> split_list(const std::string &csv);
