#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <regex>
#include <random>
#include <cmath>
#include <iomanip>
#include <cctype>
#include <cstring>

namespace util {

namespace {
const char* kBase58Alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
const char* kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_required_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        throw std::runtime_error("Required environment variable " + name + " is not set");
    }
    return std::string(value);
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer value for env var " + name + ": " + value);
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid numeric value for env var " + name + ": " + value);
    }
}

bool get_env_bool(const std::string& name, bool default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return default_value;
    }
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

int64_t to_unix_millis(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool is_valid_solana_address(const std::string& address) {
    if (address.length() < 32 || address.length() > 44) {
        return false;
    }

    // Check for valid base58 characters
    static const std::regex base58_regex("^[1-9A-HJ-NP-Za-km-z]+$");
    return std::regex_match(address, base58_regex);
}

double safe_parse_double(const std::string& str, double default_value) {
    try {
        return std::stod(str);
    } catch (const std::exception&) {
        return default_value;
    }
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-" << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

double random_jitter(double base_value, double jitter_factor) {
    if (jitter_factor <= 0.0) {
        return base_value;
    }
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter = dis(gen);
    return base_value * (1.0 + jitter);
}

bool is_network_error(int http_status) {
    return http_status == 0 ||   // Connection failed
           http_status == 408 || // Request timeout
           http_status == 429 || // Too many requests
           http_status == 502 || // Bad gateway
           http_status == 503 || // Service unavailable
           http_status == 504;   // Gateway timeout
}

bool is_transient_http_status(int http_status) {
    return is_network_error(http_status) ||
           (http_status >= 500 && http_status < 600);
}

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    std::string rest;

    if (starts_with(url, "https://")) {
        parts.scheme = "https";
        parts.port = 443;
        rest = url.substr(8);
    } else if (starts_with(url, "wss://")) {
        parts.scheme = "wss";
        parts.port = 443;
        rest = url.substr(6);
    } else if (starts_with(url, "http://")) {
        parts.scheme = "http";
        parts.port = 80;
        rest = url.substr(7);
    } else {
        throw std::runtime_error("Unsupported URL: " + url);
    }

    auto slash_pos = rest.find('/');
    std::string authority = slash_pos == std::string::npos ? rest : rest.substr(0, slash_pos);
    parts.path = slash_pos == std::string::npos ? "/" : rest.substr(slash_pos);

    auto colon_pos = authority.find(':');
    if (colon_pos != std::string::npos) {
        parts.host = authority.substr(0, colon_pos);
        parts.port = std::stoi(authority.substr(colon_pos + 1));
    } else {
        parts.host = authority;
    }

    if (parts.host.empty()) {
        throw std::runtime_error("URL has no host: " + url);
    }
    return parts;
}

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base-256 to base-58 long division, little-endian digits
    std::vector<uint8_t> digits;
    for (size_t i = leading_zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        for (auto& digit : digits) {
            carry += digit << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(kBase58Alphabet[*it]);
    }
    return result;
}

std::vector<uint8_t> base58_decode(const std::string& str) {
    size_t leading_ones = 0;
    while (leading_ones < str.size() && str[leading_ones] == '1') {
        ++leading_ones;
    }

    std::vector<uint8_t> bytes;
    for (size_t i = leading_ones; i < str.size(); ++i) {
        const char* pos = std::strchr(kBase58Alphabet, str[i]);
        if (!pos || *pos == '\0') {
            throw std::runtime_error("Invalid base58 character");
        }
        int carry = static_cast<int>(pos - kBase58Alphabet);
        for (auto& byte : bytes) {
            carry += byte * 58;
            byte = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(leading_ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out.push_back(kBase64Alphabet[(n >> 18) & 63]);
        out.push_back(kBase64Alphabet[(n >> 12) & 63]);
        out.push_back(kBase64Alphabet[(n >> 6) & 63]);
        out.push_back(kBase64Alphabet[n & 63]);
        i += 3;
    }

    size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        uint32_t n = bytes[i] << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 63]);
        out.push_back(kBase64Alphabet[(n >> 12) & 63]);
        out.append("==");
    } else if (remaining == 2) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 63]);
        out.push_back(kBase64Alphabet[(n >> 12) & 63]);
        out.push_back(kBase64Alphabet[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& str) {
    std::vector<uint8_t> out;
    uint32_t buffer = 0;
    int bits = 0;

    for (char c : str) {
        if (c == '=') {
            break;
        }
        if (c == '\n' || c == '\r' || c == ' ') {
            continue;
        }
        const char* pos = std::strchr(kBase64Alphabet, c);
        if (!pos || *pos == '\0') {
            throw std::runtime_error("Invalid base64 character");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(pos - kBase64Alphabet);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
        }
    }
    return out;
}

uint64_t to_raw_amount(double ui_amount, int decimals) {
    if (ui_amount <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(std::llround(ui_amount * std::pow(10.0, decimals)));
}

double from_raw_amount(uint64_t raw_amount, int decimals) {
    return static_cast<double>(raw_amount) / std::pow(10.0, decimals);
}

} // namespace util
