/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 по векторам NIST
 */

#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "core/hex.hpp"

#include <string>

namespace bchpool::tests {

namespace {

ByteSpan as_bytes(const std::string& text) {
    return ByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace

class Sha256Test : public ::testing::Test {};

TEST_F(Sha256Test, EmptyInput) {
    EXPECT_EQ(to_hex(crypto::sha256(ByteSpan{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(Sha256Test, Abc) {
    std::string text = "abc";
    EXPECT_EQ(to_hex(crypto::sha256(as_bytes(text))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @brief Сообщение длиной 56 байт: padding уходит во второй блок
 */
TEST_F(Sha256Test, TwoBlockMessage) {
    std::string text = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    EXPECT_EQ(to_hex(crypto::sha256(as_bytes(text))),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_F(Sha256Test, StreamingMatchesOneShot) {
    std::string text(1000, 'x');
    auto expected = crypto::sha256(as_bytes(text));

    crypto::Sha256 hasher;
    for (std::size_t offset = 0; offset < text.size(); offset += 37) {
        auto len = std::min<std::size_t>(37, text.size() - offset);
        hasher.write(ByteSpan(reinterpret_cast<const uint8_t*>(text.data()) + offset, len));
    }
    EXPECT_EQ(hasher.finalize(), expected);

    // После finalize объект снова пуст
    EXPECT_EQ(hasher.finalize(), crypto::sha256(ByteSpan{}));
}

TEST_F(Sha256Test, DoubleHash) {
    std::string text = "hello";
    auto once = crypto::sha256(as_bytes(text));
    EXPECT_EQ(crypto::sha256d(as_bytes(text)), crypto::sha256(once));
    EXPECT_EQ(to_hex(crypto::sha256d(as_bytes(text))),
              "9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50");
}

} // namespace bchpool::tests
