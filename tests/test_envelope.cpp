#include "hxfer/envelope.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace hxfer;
using namespace hxfer::test;

TEST(ContentKeyTest, FreshKeysDiffer) {
    ContentKey a = Envelope::generate_session_key();
    ContentKey b = Envelope::generate_session_key();
    ASSERT_FALSE(a.empty());
    EXPECT_NE(std::memcmp(a.data(), b.data(), KEY_LEN), 0);
}

TEST(ContentKeyTest, MoveLeavesSourceEmpty) {
    ContentKey a = Envelope::generate_session_key();
    std::vector<uint8_t> copy(a.data(), a.data() + KEY_LEN);
    ContentKey b(std::move(a));
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(std::memcmp(b.data(), copy.data(), KEY_LEN), 0);
    b.clear();
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(std::vector<uint8_t>(b.data(), b.data() + KEY_LEN), std::vector<uint8_t>(KEY_LEN, 0));
}

TEST(KeyWrapTest, UnwrapRecoversKey) {
    ContentKey key = Envelope::generate_session_key();
    WrappedKey blob = Envelope::wrap_key(key, receiver_public());
    EXPECT_EQ(blob.size(), receiver_private().size());
    ContentKey back = Envelope::unwrap_key(blob, receiver_private());
    EXPECT_EQ(std::memcmp(key.data(), back.data(), KEY_LEN), 0);
}

TEST(KeyWrapTest, WrappingIsRandomized) {
    ContentKey key = Envelope::generate_session_key();
    EXPECT_NE(Envelope::wrap_key(key, receiver_public()), Envelope::wrap_key(key, receiver_public()));
}

TEST(KeyWrapTest, WrongPrivateKeyFails) {
    ContentKey key = Envelope::generate_session_key();
    WrappedKey blob = Envelope::wrap_key(key, receiver_public());
    EXPECT_THROW(Envelope::unwrap_key(blob, stranger_private()), KeyUnwrapError);
}

TEST(KeyWrapTest, TamperedOrTruncatedBlobFails) {
    ContentKey key = Envelope::generate_session_key();
    WrappedKey blob = Envelope::wrap_key(key, receiver_public());
    WrappedKey flipped = blob;
    flipped[10] ^= 0x04;
    EXPECT_THROW(Envelope::unwrap_key(flipped, receiver_private()), KeyUnwrapError);
    WrappedKey shortened(blob.begin(), blob.end() - 1);
    EXPECT_THROW(Envelope::unwrap_key(shortened, receiver_private()), KeyUnwrapError);
}

TEST(KeyWrapTest, NonRsaOrTooSmallPeerKeyFails) {
    ContentKey key = Envelope::generate_session_key();
    PublicKey ec = PublicKey::from_private(PrivateKey(EVP_EC_gen("P-256")));
    EXPECT_THROW(Envelope::wrap_key(key, ec), KeyWrapError);
    PublicKey tiny = PublicKey::from_private(generate_rsa(512));
    EXPECT_THROW(Envelope::wrap_key(key, tiny), KeyWrapError);
    EXPECT_THROW(Envelope::wrap_key(ContentKey(), receiver_public()), KeyWrapError);
}

namespace {

std::vector<uint8_t> unhex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) out.push_back((uint8_t)std::stoi(hex.substr(i, 2), nullptr, 16));
    return out;
}

} // namespace

TEST(ChunkCipherTest, DerivesKnownChunkKeys) {
    uint8_t raw[KEY_LEN];
    for (size_t i = 0; i < KEY_LEN; ++i) raw[i] = (uint8_t)i;
    ContentKey key(raw);
    ChunkKeys keys;
    ASSERT_NO_THROW(Envelope::derive_chunk_keys(key, keys));
    EXPECT_EQ(std::vector<uint8_t>(keys.enc_key.begin(), keys.enc_key.end()),
              unhex("79da7e7521f07ebd69e71c397b344c4489bdf38c611bd17c0061c4d0d7bcb178"));
    EXPECT_EQ(std::vector<uint8_t>(keys.nonce_base.begin(), keys.nonce_base.end()),
              unhex("c0aa0e80bb6c606a7c1c9a84"));
    EXPECT_THROW(Envelope::derive_chunk_keys(ContentKey(), keys), std::logic_error);
}

TEST(ChunkCipherTest, NonceDerivesFromIndex) {
    std::array<uint8_t, NONCE_LEN> base{};
    for (size_t i = 0; i < base.size(); ++i) base[i] = (uint8_t)(0xa0 + i);
    EXPECT_EQ(Envelope::chunk_nonce(base, 0), base);
    auto n1 = Envelope::chunk_nonce(base, 1);
    auto n256 = Envelope::chunk_nonce(base, 256);
    EXPECT_EQ(n1[NONCE_LEN - 1], (uint8_t)(base[NONCE_LEN - 1] ^ 0x01));
    EXPECT_TRUE(std::equal(base.begin(), base.end() - 1, n1.begin()));
    EXPECT_EQ(n256[NONCE_LEN - 2], (uint8_t)(base[NONCE_LEN - 2] ^ 0x01));
    EXPECT_NE(n1, n256);
}

TEST(ChunkCipherTest, RoundTripAndIndexBinding) {
    ContentKey key = Envelope::generate_session_key();
    const std::vector<uint8_t> aad = {'h', 'd', 'r'};
    auto pt = random_payload(1000);

    SealedChunk c0 = Envelope::encrypt_chunk(key, pt, 0, aad);
    SealedChunk c1 = Envelope::encrypt_chunk(key, pt, 1, aad);
    EXPECT_EQ(c0.ciphertext.size(), pt.size());
    EXPECT_NE(c0.ciphertext, c1.ciphertext);
    EXPECT_EQ(Envelope::decrypt_chunk(key, c0.ciphertext, c0.tag, 0, aad), pt);
    EXPECT_EQ(Envelope::decrypt_chunk(key, c1.ciphertext, c1.tag, 1, aad), pt);

    EXPECT_THROW(Envelope::decrypt_chunk(key, c0.ciphertext, c0.tag, 1, aad), ChunkAuthError);
    EXPECT_THROW(Envelope::decrypt_chunk(key, c0.ciphertext, c0.tag, 0, {'x'}), ChunkAuthError);
}

TEST(ChunkCipherTest, BitFlipsAreDetected) {
    ContentKey key = Envelope::generate_session_key();
    ChunkKeys keys;
    Envelope::derive_chunk_keys(key, keys);
    auto pt = random_payload(64);
    SealedChunk c = Envelope::encrypt_chunk(keys, pt, 7, {});

    for (size_t i = 0; i < c.ciphertext.size(); ++i) {
        auto ct = c.ciphertext;
        ct[i] ^= 0x10;
        EXPECT_THROW(Envelope::decrypt_chunk(keys, ct, c.tag, 7, {}), ChunkAuthError) << "ciphertext byte " << i;
    }
    for (size_t i = 0; i < TAG_LEN; ++i) {
        Tag tag = c.tag;
        tag[i] ^= 0x01;
        EXPECT_THROW(Envelope::decrypt_chunk(keys, c.ciphertext, tag, 7, {}), ChunkAuthError) << "tag byte " << i;
    }
}

TEST(ChunkCipherTest, DifferentSessionKeyFails) {
    ContentKey a = Envelope::generate_session_key();
    ContentKey b = Envelope::generate_session_key();
    auto pt = random_payload(32);
    SealedChunk c = Envelope::encrypt_chunk(a, pt, 0);
    EXPECT_THROW(Envelope::decrypt_chunk(b, c.ciphertext, c.tag, 0), ChunkAuthError);
}
