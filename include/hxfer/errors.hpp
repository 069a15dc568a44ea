#pragma once
#include <stdexcept>
#include <string>

namespace hxfer {

enum class AbortReason {
    None,
    KeyWrap,
    KeyUnwrap,
    HeaderLimit,
    FrameSize,
    ChunkAuth,
    DigestMismatch,
    SignatureMismatch,
    ChannelClosed,
    Protocol,
    Io,
    Internal
};

const char* reason_name(AbortReason r);

// Every error a transfer session can end with. Terminal, never retried.
class TransferError : public std::runtime_error {
public:
    TransferError(AbortReason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}
    AbortReason reason() const noexcept { return reason_; }
private:
    AbortReason reason_;
};

class KeyWrapError : public TransferError {
public:
    explicit KeyWrapError(const std::string& what) : TransferError(AbortReason::KeyWrap, what) {}
};

class KeyUnwrapError : public TransferError {
public:
    explicit KeyUnwrapError(const std::string& what) : TransferError(AbortReason::KeyUnwrap, what) {}
};

class HeaderLimitError : public TransferError {
public:
    explicit HeaderLimitError(const std::string& what) : TransferError(AbortReason::HeaderLimit, what) {}
};

class FrameSizeError : public TransferError {
public:
    explicit FrameSizeError(const std::string& what) : TransferError(AbortReason::FrameSize, what) {}
};

class ChunkAuthError : public TransferError {
public:
    explicit ChunkAuthError(const std::string& what) : TransferError(AbortReason::ChunkAuth, what) {}
};

class DigestMismatchError : public TransferError {
public:
    explicit DigestMismatchError(const std::string& what) : TransferError(AbortReason::DigestMismatch, what) {}
};

class SignatureMismatchError : public TransferError {
public:
    explicit SignatureMismatchError(const std::string& what) : TransferError(AbortReason::SignatureMismatch, what) {}
};

class ChannelClosedError : public TransferError {
public:
    explicit ChannelClosedError(const std::string& what) : TransferError(AbortReason::ChannelClosed, what) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& what) : TransferError(AbortReason::Protocol, what) {}
};

class IoError : public TransferError {
public:
    explicit IoError(const std::string& what) : TransferError(AbortReason::Io, what) {}
};

} // namespace hxfer
