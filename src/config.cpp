#include "hxfer/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace hxfer {

static std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return b < e ? std::string(b, e) : std::string();
}

Config Config::parse(const std::string& text) {
    Config cfg;
    std::istringstream in(text);
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        auto t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos)
            throw std::invalid_argument("config line " + std::to_string(lineno) + ": expected key = value");
        auto key = trim(t.substr(0, eq));
        if (key.empty())
            throw std::invalid_argument("config line " + std::to_string(lineno) + ": empty key");
        cfg.values_[key] = trim(t.substr(eq + 1));
    }
    return cfg;
}

Config Config::load_file(const std::string& path) {
    std::ifstream fin(path);
    if (!fin) throw std::runtime_error("open config failed: " + path);
    std::ostringstream ss;
    ss << fin.rdbuf();
    return parse(ss.str());
}

bool Config::has(const std::string& key) const { return values_.count(key) != 0; }

std::string Config::get(const std::string& key, const std::string& def) const {
    auto it = values_.find(key);
    return it == values_.end() ? def : it->second;
}

uint64_t Config::get_u64(const std::string& key, uint64_t def) const {
    auto it = values_.find(key);
    if (it == values_.end()) return def;
    const std::string& v = it->second;
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw std::invalid_argument("config " + key + ": not an unsigned integer: " + v);
    try {
        return std::stoull(v);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("config " + key + ": out of range: " + v);
    }
}

bool Config::get_bool(const std::string& key, bool def) const {
    auto it = values_.find(key);
    if (it == values_.end()) return def;
    std::string v(it->second);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    throw std::invalid_argument("config " + key + ": not a boolean: " + it->second);
}

void Config::set(const std::string& key, const std::string& value) { values_[key] = value; }

template<typename T>
static T narrow(const std::string& key, uint64_t v) {
    if (v > std::numeric_limits<T>::max()) throw std::invalid_argument("config " + key + ": value too large");
    return (T)v;
}

SessionOptions Config::session_options() const {
    SessionOptions o;
    const Limits d;
    o.limits.max_file_size = get_u64("max_file_size", d.max_file_size);
    o.limits.max_chunk_size = narrow<uint32_t>("max_chunk_size", get_u64("max_chunk_size", d.max_chunk_size));
    o.limits.max_name_len = narrow<uint16_t>("max_name_len", get_u64("max_name_len", d.max_name_len));
    o.limits.max_signature_len = narrow<uint16_t>("max_signature_len", get_u64("max_signature_len", d.max_signature_len));
    o.limits.max_wrapped_key_len = narrow<uint16_t>("max_wrapped_key_len", get_u64("max_wrapped_key_len", d.max_wrapped_key_len));
    o.chunk_size = narrow<uint32_t>("chunk_size", get_u64("chunk_size", DEFAULT_CHUNK_SIZE));
    o.require_signature = get_bool("require_signature", false);

    if (o.chunk_size == 0) throw std::invalid_argument("config chunk_size: must be positive");
    if (o.limits.max_chunk_size == 0) throw std::invalid_argument("config max_chunk_size: must be positive");
    if (o.chunk_size > o.limits.max_chunk_size)
        throw std::invalid_argument("config chunk_size: exceeds max_chunk_size");
    if (o.limits.max_name_len == 0) throw std::invalid_argument("config max_name_len: must be positive");
    return o;
}

int Config::io_timeout_ms() const {
    return narrow<int>("io_timeout_ms", get_u64("io_timeout_ms", 30000));
}

LogLevel Config::log_level() const { return parse_log_level(get("log_level", "info")); }

} // namespace hxfer
