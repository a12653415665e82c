/**
 * @file test_address.cpp
 * @brief Тесты CashAddr / legacy адресов
 */

#include <gtest/gtest.h>

#include "bitcoin/address.hpp"
#include "bitcoin/base58.hpp"
#include "core/hex.hpp"

#include <algorithm>
#include <cctype>

namespace bchpool::tests {

using namespace bitcoin;

class AddressTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto bytes = from_hex("76a04053bda0a88bda5177b86a15c3b29f559873");
        ASSERT_TRUE(bytes.has_value());
        std::copy(bytes->begin(), bytes->end(), hash_.begin());
    }

    Hash160 hash_{};

    static constexpr std::string_view MAINNET_P2KH = "bitcoincash:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdx6a";
    static constexpr std::string_view MAINNET_P2SH = "bitcoincash:ppm2qsznhks23z7629mms6s4cwef74vcwvn0h829pq";
    static constexpr std::string_view TESTNET_P2KH = "bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap";
    static constexpr std::string_view REGTEST_P2KH = "bchreg:qpm2qsznhks23z7629mms6s4cwef74vcwv6ycwvz78";
};

// =============================================================================
// Сеть
// =============================================================================

TEST_F(AddressTest, ParseNetworkNames) {
    EXPECT_EQ(parse_network("mainnet").value(), Network::Mainnet);
    EXPECT_EQ(parse_network("main").value(), Network::Mainnet);
    EXPECT_EQ(parse_network("testnet").value(), Network::Testnet);
    EXPECT_EQ(parse_network("test").value(), Network::Testnet);
    EXPECT_EQ(parse_network("regtest").value(), Network::Regtest);
    EXPECT_FALSE(parse_network("signet").has_value());
}

TEST_F(AddressTest, NetworkParams) {
    EXPECT_EQ(network_params(Network::Mainnet).cashaddr_prefix, "bitcoincash");
    EXPECT_EQ(network_params(Network::Testnet).cashaddr_prefix, "bchtest");
    EXPECT_EQ(network_params(Network::Regtest).cashaddr_prefix, "bchreg");
    EXPECT_EQ(network_params(Network::Mainnet).p2kh_version, 0x00);
    EXPECT_EQ(network_params(Network::Mainnet).p2sh_version, 0x05);
    EXPECT_EQ(network_params(Network::Testnet).p2kh_version, 0x6f);
    EXPECT_EQ(network_params(Network::Regtest).p2sh_version, 0xc4);
}

// =============================================================================
// CashAddr
// =============================================================================

TEST_F(AddressTest, EncodeKnownVectors) {
    EXPECT_EQ(encode_cashaddr("bitcoincash", AddressType::P2KH, hash_), MAINNET_P2KH);
    EXPECT_EQ(encode_cashaddr("bitcoincash", AddressType::P2SH, hash_), MAINNET_P2SH);
    EXPECT_EQ(encode_cashaddr("bchtest", AddressType::P2KH, hash_), TESTNET_P2KH);
    EXPECT_EQ(encode_cashaddr("bchreg", AddressType::P2KH, hash_), REGTEST_P2KH);
}

TEST_F(AddressTest, DecodeKnownVector) {
    auto decoded = decode_cashaddr(MAINNET_P2SH);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->prefix, "bitcoincash");
    EXPECT_EQ(decoded->type, AddressType::P2SH);
    EXPECT_EQ(decoded->hash, hash_);
}

/**
 * @brief decode(encode(prefix, type, hash)) == (prefix, type, hash)
 */
TEST_F(AddressTest, RoundTripAllPrefixesAndTypes) {
    for (std::string_view prefix : {"bitcoincash", "bchtest", "bchreg"}) {
        for (auto type : {AddressType::P2KH, AddressType::P2SH}) {
            for (uint8_t seed : {0x00, 0x01, 0x7f, 0xff}) {
                Hash160 hash{};
                for (std::size_t i = 0; i < hash.size(); ++i) {
                    hash[i] = static_cast<uint8_t>(seed + i * 13);
                }

                auto decoded = decode_cashaddr(encode_cashaddr(prefix, type, hash));
                ASSERT_TRUE(decoded.has_value()) << prefix;
                EXPECT_EQ(*decoded, (CashAddress{std::string(prefix), type, hash}));
            }
        }
    }
}

TEST_F(AddressTest, DecodeUppercase) {
    std::string upper(TESTNET_P2KH);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto decoded = decode_cashaddr(upper);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->prefix, "bchtest");
    EXPECT_EQ(decoded->hash, hash_);
}

TEST_F(AddressTest, DecodeRejectsMixedCase) {
    std::string mixed(TESTNET_P2KH);
    mixed[9] = static_cast<char>(std::toupper(static_cast<unsigned char>(mixed[9])));

    auto decoded = decode_cashaddr(mixed);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::AddressInvalidCharacter);
}

TEST_F(AddressTest, DecodeWithoutPrefixUsesDefault) {
    std::string_view payload = TESTNET_P2KH.substr(TESTNET_P2KH.find(':') + 1);

    auto decoded = decode_cashaddr(payload, "bchtest");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->prefix, "bchtest");

    auto no_default = decode_cashaddr(payload);
    ASSERT_FALSE(no_default.has_value());
    EXPECT_EQ(no_default.error().code, ErrorCode::AddressInvalidPrefix);

    // Контрольная сумма считается с префиксом
    auto wrong_default = decode_cashaddr(payload, "bitcoincash");
    ASSERT_FALSE(wrong_default.has_value());
    EXPECT_EQ(wrong_default.error().code, ErrorCode::AddressInvalidChecksum);
}

TEST_F(AddressTest, DecodeRejectsBadChecksum) {
    std::string corrupted(MAINNET_P2KH);
    corrupted.back() = corrupted.back() == 'q' ? 'p' : 'q';

    auto decoded = decode_cashaddr(corrupted);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::AddressInvalidChecksum);
}

TEST_F(AddressTest, DecodeRejectsUnknownPrefix) {
    auto decoded = decode_cashaddr("bitcoin:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdx6a");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::AddressInvalidPrefix);
}

TEST_F(AddressTest, DecodeRejectsBadCharacter) {
    // 'b' не входит в алфавит CashAddr
    auto decoded = decode_cashaddr("bitcoincash:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdxba");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::AddressInvalidCharacter);
}

TEST_F(AddressTest, DecodeRejectsWrongLength) {
    // Корректная контрольная сумма, но 19-байтный хеш
    Hash160 full = hash_;
    std::string encoded = encode_cashaddr("bitcoincash", AddressType::P2KH, full);
    auto truncated = decode_cashaddr(encoded.substr(0, encoded.size() - 2));
    ASSERT_FALSE(truncated.has_value());

    auto too_short = decode_cashaddr("bitcoincash:qpm2q");
    ASSERT_FALSE(too_short.has_value());
    EXPECT_EQ(too_short.error().code, ErrorCode::AddressInvalidLength);
}

// =============================================================================
// Legacy
// =============================================================================

TEST_F(AddressTest, LegacyKnownVectors) {
    EXPECT_EQ(encode_legacy(Network::Mainnet, AddressType::P2KH, hash_),
              "1BpEi6DfDAUFd7GtittLSdBeYJvcoaVggu");
    EXPECT_EQ(encode_legacy(Network::Mainnet, AddressType::P2SH, hash_),
              "3CWFddi6m4ndiGyKqzYvsFYagqDLPVMTzC");
    EXPECT_EQ(encode_legacy(Network::Testnet, AddressType::P2KH, hash_),
              "mrLC19Je2BuWQDkWSTriGYPyQJXKkkBmCx");
}

TEST_F(AddressTest, LegacyConversion) {
    auto legacy = to_legacy(MAINNET_P2KH);
    ASSERT_TRUE(legacy.has_value());
    EXPECT_EQ(*legacy, "1BpEi6DfDAUFd7GtittLSdBeYJvcoaVggu");

    auto cash = from_legacy("3CWFddi6m4ndiGyKqzYvsFYagqDLPVMTzC");
    ASSERT_TRUE(cash.has_value());
    EXPECT_EQ(*cash, MAINNET_P2SH);

    auto regtest = from_legacy("mrLC19Je2BuWQDkWSTriGYPyQJXKkkBmCx", Network::Regtest);
    ASSERT_TRUE(regtest.has_value());
    EXPECT_EQ(*regtest, REGTEST_P2KH);
}

TEST_F(AddressTest, LegacyRejectsBadChecksum) {
    EXPECT_FALSE(decode_legacy("1BpEi6DfDAUFd7GtittLSdBeYJvcoaVggv").has_value());
}

TEST_F(AddressTest, Base58LeadingZeros) {
    Bytes data = {0x00, 0x00, 0x01};
    auto encoded = encode_base58(data);
    EXPECT_EQ(encoded.substr(0, 2), "11");

    auto decoded = decode_base58(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

// =============================================================================
// Адрес выплаты
// =============================================================================

TEST_F(AddressTest, ExtractFromTestnetLegacy) {
    auto extracted = extract_hash160("mipcBbFg9gMiCh81Kj8tqqdgoZub1ZJRfn", Network::Testnet);
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(extracted->type, AddressType::P2KH);
    EXPECT_EQ(to_hex(extracted->hash), "243f1394f44554f4ce3fd68649c19adc483ce924");
}

TEST_F(AddressTest, ExtractRejectsOtherNetwork) {
    EXPECT_FALSE(extract_hash160(MAINNET_P2KH, Network::Testnet).has_value());
    EXPECT_FALSE(extract_hash160("1BpEi6DfDAUFd7GtittLSdBeYJvcoaVggu", Network::Testnet).has_value());
    EXPECT_FALSE(extract_hash160("mipcBbFg9gMiCh81Kj8tqqdgoZub1ZJRfn", Network::Mainnet).has_value());
}

TEST_F(AddressTest, NormalizeToPrefixedCashAddr) {
    EXPECT_EQ(normalize_address("mipcBbFg9gMiCh81Kj8tqqdgoZub1ZJRfn", Network::Testnet).value(),
              "bchtest:qqjr7yu573z4faxw8ltgvjwpntwys08fysk07zmvce");
    EXPECT_EQ(normalize_address("qpm2qsznhks23z7629mms6s4cwef74vcwvqcw003ap", Network::Testnet).value(),
              TESTNET_P2KH);
    EXPECT_EQ(normalize_address("BCHTEST:QPM2QSZNHKS23Z7629MMS6S4CWEF74VCWVQCW003AP", Network::Testnet).value(),
              TESTNET_P2KH);
}

TEST_F(AddressTest, IsValidAddress) {
    EXPECT_TRUE(is_valid_address(TESTNET_P2KH, Network::Testnet));
    EXPECT_TRUE(is_valid_address(MAINNET_P2SH, Network::Mainnet));
    EXPECT_FALSE(is_valid_address("", Network::Mainnet));
    EXPECT_FALSE(is_valid_address("not-an-address", Network::Mainnet));
    EXPECT_FALSE(is_valid_address("bchtest:qq", Network::Testnet));
}

} // namespace bchpool::tests
