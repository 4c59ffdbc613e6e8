#pragma once
#include <chrono>
#include <string>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::string trim(const std::string& str);
std::string to_lower(std::string str);
bool parse_bool(const std::string& str);

// File utilities
std::string read_file(const std::string& path);

// Encoding utilities
std::string base64_encode(const std::string& data);

// Time utilities
std::string format_seconds(std::chrono::milliseconds duration);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
