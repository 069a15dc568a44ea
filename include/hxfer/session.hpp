#pragma once
#include "hxfer/channel.hpp"
#include "hxfer/config.hpp"
#include "hxfer/digest.hpp"
#include "hxfer/envelope.hpp"
#include "hxfer/errors.hpp"
#include "hxfer/framing.hpp"
#include "hxfer/keys.hpp"
#include "hxfer/sink.hpp"
#include <string>

namespace hxfer {

enum class SessionState {
    Init,
    KeyExchanged,
    Transferring,
    Verifying,
    Completed,
    Aborted
};

const char* state_name(SessionState s);

struct TransferReport {
    std::string name;
    uint64_t    size = 0;
    Digest      digest{};
    bool        is_signed = false;
    std::string path; // committed path (receiver) or source path (sender)
};

// One protocol run over one channel. Not reusable: a second run throws
// std::logic_error. On any failure the session moves to Aborted, drops the
// content key, discards partial output, closes the channel and rethrows.
class Session {
public:
    virtual ~Session() = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SessionState state() const { return state_; }
    AbortReason reason() const { return reason_; }
    void set_label(const std::string& label) { label_ = label; }

protected:
    Session(Channel& channel, const SessionOptions& options);

    void begin();
    void transition(SessionState next);
    void abort(AbortReason reason, const std::string& what);
    void finish();
    virtual void on_abort() {}

    Channel& channel_;
    SessionOptions options_;
    ContentKey key_;
    std::string label_ = "session";

private:
    SessionState state_ = SessionState::Init;
    AbortReason reason_ = AbortReason::None;
};

class SenderSession : public Session {
public:
    // signing_key may be null: the stream is then sent unsigned.
    SenderSession(Channel& channel, const PublicKey& receiver_key,
                  const PrivateKey* signing_key, const SessionOptions& options = SessionOptions());

    // name defaults to the basename of path.
    TransferReport send_file(const std::string& path, const std::string& name = "");

private:
    const PublicKey& receiver_key_;
    const PrivateKey* signing_key_;
};

class ReceiverSession : public Session {
public:
    // sender_key may be null: signed streams are then rejected.
    ReceiverSession(Channel& channel, const PrivateKey& receiver_key,
                    const PublicKey* sender_key, OutputSink& sink,
                    const SessionOptions& options = SessionOptions());

    TransferReport receive();

private:
    void on_abort() override;

    const PrivateKey& receiver_key_;
    const PublicKey* sender_key_;
    OutputSink& sink_;
};

} // namespace hxfer
