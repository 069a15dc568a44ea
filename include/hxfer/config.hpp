#pragma once
#include "hxfer/framing.hpp"
#include "hxfer/log.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace hxfer {

static constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;

struct SessionOptions {
    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    Limits limits;
    bool require_signature = false;
};

// "key = value" settings, '#' starts a comment line.
class Config {
public:
    Config() = default;

    static Config load_file(const std::string& path);
    static Config parse(const std::string& text);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    uint64_t get_u64(const std::string& key, uint64_t def) const;
    bool get_bool(const std::string& key, bool def) const;
    void set(const std::string& key, const std::string& value);

    // Throws std::invalid_argument on out-of-range or inconsistent values.
    SessionOptions session_options() const;
    LogLevel log_level() const;
    // Socket timeout for transfers; 0 disables.
    int io_timeout_ms() const;
    std::string log_file() const { return get("log_file"); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace hxfer
