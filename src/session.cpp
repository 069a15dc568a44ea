#include "hxfer/session.hpp"
#include "hxfer/log.hpp"
#include <openssl/crypto.h>
#include <filesystem>
#include <fstream>

namespace hxfer {

const char* state_name(SessionState s) {
    switch (s) {
        case SessionState::Init:         return "Init";
        case SessionState::KeyExchanged: return "KeyExchanged";
        case SessionState::Transferring: return "Transferring";
        case SessionState::Verifying:    return "Verifying";
        case SessionState::Completed:    return "Completed";
        case SessionState::Aborted:      return "Aborted";
    }
    return "Unknown";
}

Session::Session(Channel& channel, const SessionOptions& options)
    : channel_(channel), options_(options) {}

void Session::begin() {
    if (state_ != SessionState::Init) throw std::logic_error("session already used");
}

void Session::transition(SessionState next) {
    Logger::instance().debug("[{}] {} -> {}", label_, state_name(state_), state_name(next));
    state_ = next;
}

void Session::abort(AbortReason reason, const std::string& what) {
    Logger::instance().warning("[{}] aborted in {}: {} ({})", label_, state_name(state_), reason_name(reason), what);
    state_ = SessionState::Aborted;
    reason_ = reason;
    key_.clear();
    on_abort();
    channel_.close();
}

void Session::finish() {
    key_.clear();
    transition(SessionState::Completed);
    channel_.close();
}

SenderSession::SenderSession(Channel& channel, const PublicKey& receiver_key,
                             const PrivateKey* signing_key, const SessionOptions& options)
    : Session(channel, options), receiver_key_(receiver_key), signing_key_(signing_key) {}

TransferReport SenderSession::send_file(const std::string& path, const std::string& name) {
    begin();
    try {
        std::error_code ec;
        const uint64_t size = std::filesystem::file_size(path, ec);
        if (ec) throw IoError("stat " + path + ": " + ec.message());
        std::ifstream fin(path, std::ios::binary);
        if (!fin) throw IoError("open input failed: " + path);

        Header h;
        h.name = name.empty() ? std::filesystem::path(path).filename().string() : name;
        if (!valid_file_name(h.name) || h.name.size() > options_.limits.max_name_len)
            throw ProtocolError("file name not transferable: " + h.name);
        h.file_size = size;
        h.chunk_size = options_.chunk_size;
        h.signing_enabled = signing_key_ != nullptr;
        h.signature_len = signing_key_ ? (uint16_t)signing_key_->size() : 0;

        key_ = Envelope::generate_session_key();
        const WrappedKey wrapped = Envelope::wrap_key(key_, receiver_key_);
        transition(SessionState::KeyExchanged);

        const std::vector<uint8_t> aad = write_header(channel_, h);
        write_wrapped_key(channel_, wrapped);

        ChunkKeys keys;
        Envelope::derive_chunk_keys(key_, keys);
        transition(SessionState::Transferring);

        DigestState digest;
        std::vector<uint8_t> buf;
        const uint64_t count = h.chunk_count();
        for (uint64_t i = 0; i < count; ++i) {
            buf.resize(h.chunk_len(i));
            fin.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)buf.size());
            if (fin.gcount() != (std::streamsize)buf.size()) throw IoError("input shrank during transfer: " + path);
            digest.update(buf);
            write_chunk(channel_, Envelope::encrypt_chunk(keys, buf, i, aad));
        }
        OPENSSL_cleanse(buf.data(), buf.size());
        transition(SessionState::Verifying);

        Trailer t;
        t.digest = digest.finalize();
        if (signing_key_) {
            Signature sig = sign(t.digest, *signing_key_);
            if (sig.size() != h.signature_len) throw std::runtime_error("signature length differs from announced");
            t.signature = std::move(sig);
        }
        write_trailer(channel_, t);
        finish();

        Logger::instance().info("[{}] sent {} ({} bytes, {} chunks, sha256 {}{})", label_, h.name, h.file_size,
                                count, to_hex(t.digest), h.signing_enabled ? ", signed" : "");
        TransferReport r;
        r.name = h.name;
        r.size = h.file_size;
        r.digest = t.digest;
        r.is_signed = h.signing_enabled;
        r.path = path;
        return r;
    } catch (const TransferError& e) {
        abort(e.reason(), e.what());
        throw;
    } catch (const std::exception& e) {
        abort(AbortReason::Internal, e.what());
        throw;
    }
}

ReceiverSession::ReceiverSession(Channel& channel, const PrivateKey& receiver_key,
                                 const PublicKey* sender_key, OutputSink& sink,
                                 const SessionOptions& options)
    : Session(channel, options), receiver_key_(receiver_key), sender_key_(sender_key), sink_(sink) {}

void ReceiverSession::on_abort() { sink_.discard(); }

TransferReport ReceiverSession::receive() {
    begin();
    try {
        std::vector<uint8_t> aad;
        const Header h = read_header(channel_, options_.limits, &aad);
        if (h.signing_enabled) {
            if (!sender_key_) throw SignatureMismatchError("signed stream but no sender key to verify against");
            if (h.signature_len != sender_key_->size())
                throw SignatureMismatchError("announced signature length does not match sender key");
        } else if (options_.require_signature) {
            throw SignatureMismatchError("unsigned stream rejected");
        }

        const WrappedKey blob = read_wrapped_key(channel_, options_.limits.max_wrapped_key_len);
        key_ = Envelope::unwrap_key(blob, receiver_key_);
        transition(SessionState::KeyExchanged);

        ChunkKeys keys;
        Envelope::derive_chunk_keys(key_, keys);
        sink_.open(h.name);
        transition(SessionState::Transferring);

        DigestState digest;
        const uint64_t count = h.chunk_count();
        for (uint64_t i = 0; i < count; ++i) {
            SealedChunk c = read_chunk(channel_, h.chunk_size);
            if (c.ciphertext.size() != h.chunk_len(i))
                throw FrameSizeError("chunk " + std::to_string(i) + " has length " +
                                     std::to_string(c.ciphertext.size()) + ", expected " +
                                     std::to_string(h.chunk_len(i)));
            std::vector<uint8_t> pt = Envelope::decrypt_chunk(keys, c.ciphertext, c.tag, i, aad);
            digest.update(pt);
            sink_.write(pt.data(), pt.size());
            OPENSSL_cleanse(pt.data(), pt.size());
        }
        transition(SessionState::Verifying);

        const Trailer t = read_trailer(channel_, h);
        const Digest computed = digest.finalize();
        if (CRYPTO_memcmp(computed.data(), t.digest.data(), DIGEST_LEN) != 0)
            throw DigestMismatchError("digest mismatch: computed " + to_hex(computed) + ", sender " + to_hex(t.digest));
        if (t.signature && !verify(computed, *t.signature, *sender_key_))
            throw SignatureMismatchError("sender signature does not verify");

        TransferReport r;
        r.path = sink_.commit();
        finish();

        Logger::instance().info("[{}] received {} ({} bytes, sha256 {}{}) -> {}", label_, h.name, h.file_size,
                                to_hex(computed), t.signature ? ", signature verified" : "", r.path);
        r.name = h.name;
        r.size = h.file_size;
        r.digest = computed;
        r.is_signed = h.signing_enabled;
        return r;
    } catch (const TransferError& e) {
        abort(e.reason(), e.what());
        throw;
    } catch (const std::exception& e) {
        abort(AbortReason::Internal, e.what());
        throw;
    }
}

} // namespace hxfer
