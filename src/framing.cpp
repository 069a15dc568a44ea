#include "hxfer/framing.hpp"
#include "hxfer/errors.hpp"
#include "openssl_utils.hpp"
#include <algorithm>

namespace hxfer {

using namespace detail;

static const uint8_t HEADER_MAGIC[4]  = {'H','X','F','1'};
static const uint8_t TRAILER_MAGIC[4] = {'H','X','T','R'};

uint64_t Header::chunk_count() const {
    if (chunk_size == 0) return 0;
    return file_size / chunk_size + (file_size % chunk_size ? 1 : 0);
}

uint32_t Header::chunk_len(uint64_t index) const {
    const uint64_t count = chunk_count();
    if (index >= count) return 0;
    if (index + 1 < count) return chunk_size;
    const uint64_t rem = file_size % chunk_size;
    return rem ? (uint32_t)rem : chunk_size;
}

bool valid_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') return false;
    }
    return true;
}

std::vector<uint8_t> encode_header(const Header& h) {
    if (h.name.size() > 0xffff) throw std::invalid_argument("file name too long");
    std::vector<uint8_t> v; v.reserve(FIXED_HDR + h.name.size());
    v.insert(v.end(), HEADER_MAGIC, HEADER_MAGIC+4);
    v.push_back(h.version);
    v.push_back(h.signing_enabled ? FLAG_SIGNED : 0x00);
    u16be(v, h.signature_len);
    u32be(v, h.chunk_size);
    u64be(v, h.file_size);
    u16be(v, (uint16_t)h.name.size());
    v.insert(v.end(), h.name.begin(), h.name.end());
    return v;
}

std::vector<uint8_t> write_header(Channel& ch, const Header& h) {
    auto v = encode_header(h);
    ch.write_all(v.data(), v.size());
    return v;
}

Header read_header(Channel& ch, const Limits& limits, std::vector<uint8_t>* raw_out) {
    uint8_t fixed[FIXED_HDR];
    ch.read_exact(fixed, FIXED_HDR);
    if (!std::equal(fixed, fixed+4, HEADER_MAGIC)) throw ProtocolError("bad header magic");

    Header h;
    h.version = fixed[4];
    if (h.version != PROTOCOL_VERSION) throw ProtocolError("unsupported protocol version " + std::to_string(h.version));
    const uint8_t flags = fixed[5];
    if (flags & ~FLAG_SIGNED) throw ProtocolError("unknown header flags");
    h.signing_enabled = (flags & FLAG_SIGNED) != 0;
    h.signature_len = be16(fixed+6);
    h.chunk_size = be32(fixed+8);
    h.file_size = be64(fixed+12);
    const uint16_t name_len = be16(fixed+20);

    if (h.chunk_size == 0 || h.chunk_size > limits.max_chunk_size)
        throw HeaderLimitError("chunk size " + std::to_string(h.chunk_size) + " outside limits");
    if (h.file_size > limits.max_file_size)
        throw HeaderLimitError("file size " + std::to_string(h.file_size) + " exceeds limit");
    if (name_len == 0 || name_len > limits.max_name_len)
        throw HeaderLimitError("name length " + std::to_string(name_len) + " outside limits");
    if (h.signature_len > limits.max_signature_len)
        throw HeaderLimitError("signature length " + std::to_string(h.signature_len) + " exceeds limit");
    if (h.signing_enabled != (h.signature_len != 0))
        throw ProtocolError("signature length inconsistent with signing flag");

    h.name.resize(name_len);
    ch.read_exact(reinterpret_cast<uint8_t*>(&h.name[0]), name_len);
    if (!valid_file_name(h.name)) throw ProtocolError("unsafe file name");

    if (raw_out) {
        raw_out->assign(fixed, fixed+FIXED_HDR);
        raw_out->insert(raw_out->end(), h.name.begin(), h.name.end());
    }
    return h;
}

void write_wrapped_key(Channel& ch, const WrappedKey& blob) {
    if (blob.empty() || blob.size() > 0xffff) throw std::invalid_argument("wrapped key length");
    std::vector<uint8_t> v; v.reserve(2 + blob.size());
    u16be(v, (uint16_t)blob.size());
    v.insert(v.end(), blob.begin(), blob.end());
    ch.write_all(v.data(), v.size());
}

WrappedKey read_wrapped_key(Channel& ch, uint16_t max_len) {
    uint8_t lenb[2];
    ch.read_exact(lenb, 2);
    const uint16_t len = be16(lenb);
    if (len == 0 || len > max_len) throw HeaderLimitError("wrapped key length " + std::to_string(len) + " outside limits");
    WrappedKey blob(len);
    ch.read_exact(blob.data(), blob.size());
    return blob;
}

void write_chunk(Channel& ch, const SealedChunk& chunk) {
    std::vector<uint8_t> lenb; lenb.reserve(4);
    u32be(lenb, (uint32_t)chunk.ciphertext.size());
    ch.write_all(lenb.data(), lenb.size());
    ch.write_all(chunk.ciphertext.data(), chunk.ciphertext.size());
    ch.write_all(chunk.tag.data(), TAG_LEN);
}

SealedChunk read_chunk(Channel& ch, uint32_t chunk_size) {
    uint8_t lenb[4];
    ch.read_exact(lenb, 4);
    const uint32_t clen = be32(lenb);
    if (clen == 0 || clen > chunk_size)
        throw FrameSizeError("chunk length " + std::to_string(clen) + " exceeds bound " + std::to_string(chunk_size));
    SealedChunk c;
    c.ciphertext.resize(clen);
    ch.read_exact(c.ciphertext.data(), clen);
    ch.read_exact(c.tag.data(), TAG_LEN);
    return c;
}

void write_trailer(Channel& ch, const Trailer& t) {
    const size_t sig_len = t.signature ? t.signature->size() : 0;
    if (sig_len > 0xffff) throw std::invalid_argument("signature too long");
    std::vector<uint8_t> v; v.reserve(4 + DIGEST_LEN + 2 + sig_len);
    v.insert(v.end(), TRAILER_MAGIC, TRAILER_MAGIC+4);
    v.insert(v.end(), t.digest.begin(), t.digest.end());
    u16be(v, (uint16_t)sig_len);
    if (t.signature) v.insert(v.end(), t.signature->begin(), t.signature->end());
    ch.write_all(v.data(), v.size());
}

Trailer read_trailer(Channel& ch, const Header& h) {
    uint8_t fixed[4 + DIGEST_LEN + 2];
    ch.read_exact(fixed, sizeof(fixed));
    if (!std::equal(fixed, fixed+4, TRAILER_MAGIC)) throw ProtocolError("bad trailer marker");
    Trailer t;
    std::copy_n(fixed+4, DIGEST_LEN, t.digest.begin());
    const uint16_t sig_len = be16(fixed+4+DIGEST_LEN);
    if (sig_len != h.signature_len) throw ProtocolError("trailer signature length differs from header");
    if (h.signing_enabled) {
        Signature sig(sig_len);
        ch.read_exact(sig.data(), sig.size());
        t.signature = std::move(sig);
    }
    return t;
}

} // namespace hxfer
