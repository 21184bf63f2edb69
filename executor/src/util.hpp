#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
std::string to_lower(const std::string& str);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
int64_t to_unix_millis(const std::chrono::system_clock::time_point& tp);

// Validation utilities
bool is_valid_solana_address(const std::string& address);
double safe_parse_double(const std::string& str, double default_value = 0.0);

// Random utilities
std::string generate_uuid();
double random_jitter(double base_value, double jitter_factor = 0.1);

// Network utilities
bool is_network_error(int http_status);
bool is_transient_http_status(int http_status);

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 443;
    std::string path = "/";
};
// Splits "https://host[:port]/path?query" into its parts. Throws on other schemes.
UrlParts parse_url(const std::string& url);

// Encoding utilities
std::string base58_encode(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> base58_decode(const std::string& str);
std::string base64_encode(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> base64_decode(const std::string& str);

// Converts between UI amounts and raw integer token units
uint64_t to_raw_amount(double ui_amount, int decimals);
double from_raw_amount(uint64_t raw_amount, int decimals);

} // namespace util
