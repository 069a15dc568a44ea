#pragma once
#include "hxfer/channel.hpp"
#include "hxfer/digest.hpp"
#include "hxfer/envelope.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hxfer {

static constexpr uint8_t PROTOCOL_VERSION = 1;
static constexpr uint8_t FLAG_SIGNED      = 0x01;
static constexpr size_t  FIXED_HDR        = 22; // 4 + 1 + 1 + 2 + 4 + 8 + 2

// Receiver-side bounds applied before any buffer is sized from wire fields.
struct Limits {
    uint64_t max_file_size       = 1ull << 40;
    uint32_t max_chunk_size      = 16u << 20;
    uint16_t max_name_len        = 255;
    uint16_t max_signature_len   = 1024;
    uint16_t max_wrapped_key_len = 1024;
};

struct Header {
    uint8_t     version = PROTOCOL_VERSION;
    uint64_t    file_size = 0;
    uint32_t    chunk_size = 0;
    bool        signing_enabled = false;
    uint16_t    signature_len = 0;
    std::string name;

    uint64_t chunk_count() const;
    // Plaintext length of chunk `index`; every chunk but the last is full.
    uint32_t chunk_len(uint64_t index) const;
};

struct Trailer {
    Digest digest{};
    std::optional<Signature> signature; // present iff the header was signed
};

bool valid_file_name(const std::string& name);

std::vector<uint8_t> encode_header(const Header& h);

// Returns the serialized bytes, which also serve as chunk AAD.
std::vector<uint8_t> write_header(Channel& ch, const Header& h);
// raw_out receives the exact bytes read, for use as chunk AAD.
Header read_header(Channel& ch, const Limits& limits, std::vector<uint8_t>* raw_out = nullptr);

void write_wrapped_key(Channel& ch, const WrappedKey& blob);
WrappedKey read_wrapped_key(Channel& ch, uint16_t max_len);

void write_chunk(Channel& ch, const SealedChunk& chunk);
SealedChunk read_chunk(Channel& ch, uint32_t chunk_size);

void write_trailer(Channel& ch, const Trailer& t);
Trailer read_trailer(Channel& ch, const Header& h);

} // namespace hxfer
