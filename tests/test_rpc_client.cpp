/**
 * @file test_rpc_client.cpp
 * @brief Тесты разбора ответов RPC ноды
 */

#include <gtest/gtest.h>

#include "bitcoin/block_assembler.hpp"
#include "bitcoin/rpc_client.hpp"
#include "core/byte_order.hpp"
#include "core/hex.hpp"

#include <format>

namespace bchpool::tests {

using namespace bitcoin;

namespace {

constexpr std::string_view PREV_HASH =
    "000000000000000001b3f8b45fa8de4c5d2e1e0ac4a6c4e1b06cd5d25ba26c11";
constexpr std::string_view TXID =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

} // namespace

class RpcClientTest : public ::testing::Test {};

TEST_F(RpcClientTest, ParseBlockTemplate) {
    const std::string response = std::format(R"({{
        "version": 536870912,
        "previousblockhash": "{}",
        "transactions": [
            {{"data": "0100", "txid": "{}", "hash": "ignored", "fee": 226}}
        ],
        "coinbasevalue": 625000226,
        "curtime": 1700000000,
        "bits": "1802cc47",
        "height": 820000
    }})", PREV_HASH, TXID);

    auto tmpl = parse_block_template(response);
    ASSERT_TRUE(tmpl.has_value()) << tmpl.error().message;

    EXPECT_EQ(tmpl->height, 820000u);
    EXPECT_EQ(tmpl->version, 0x20000000u);
    EXPECT_EQ(tmpl->curtime, 1700000000u);
    // Комиссии вычитаются: в шаблоне остаётся subsidy
    EXPECT_EQ(tmpl->coinbase_value, 625000000);
    EXPECT_EQ(tmpl->bits, 0x1802cc47u);

    // Хеши хранятся в display порядке как в RPC
    EXPECT_EQ(to_hex(tmpl->prev_hash), PREV_HASH);

    ASSERT_EQ(tmpl->transactions.size(), 1u);
    EXPECT_EQ(to_hex(tmpl->transactions[0].hash), TXID);
    EXPECT_EQ(tmpl->transactions[0].fee, 226);
    EXPECT_EQ(tmpl->transactions[0].data, (Bytes{0x01, 0x00}));
    EXPECT_EQ(tmpl->total_fees(), 226);
}

TEST_F(RpcClientTest, TransactionHashUsedWithoutTxid) {
    const std::string response = std::format(R"({{
        "version": 1, "previousblockhash": "{}", "coinbasevalue": 1, "curtime": 1,
        "bits": "207fffff", "height": 1,
        "transactions": [{{"data": "", "hash": "{}"}}]
    }})", PREV_HASH, TXID);

    auto tmpl = parse_block_template(response);
    ASSERT_TRUE(tmpl.has_value()) << tmpl.error().message;
    ASSERT_EQ(tmpl->transactions.size(), 1u);
    EXPECT_EQ(to_hex(tmpl->transactions[0].hash), TXID);
    EXPECT_EQ(tmpl->transactions[0].fee, 0);
}

TEST_F(RpcClientTest, MissingTransactionsIsEmpty) {
    const std::string response = std::format(R"({{
        "version": 1, "previousblockhash": "{}", "coinbasevalue": 1, "curtime": 1,
        "bits": "207fffff", "height": 1
    }})", PREV_HASH);

    auto tmpl = parse_block_template(response);
    ASSERT_TRUE(tmpl.has_value());
    EXPECT_TRUE(tmpl->transactions.empty());
}

TEST_F(RpcClientTest, MalformedTemplates) {
    // Нет обязательного поля
    auto missing = parse_block_template(R"({"version": 1})");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::RpcParseError);

    // Короткий prev hash
    auto short_hash = parse_block_template(R"({
        "version": 1, "previousblockhash": "abcd", "coinbasevalue": 1, "curtime": 1,
        "bits": "207fffff", "height": 1
    })");
    EXPECT_FALSE(short_hash.has_value());

    auto bad_bits = parse_block_template(std::format(R"({{
        "version": 1, "previousblockhash": "{}", "coinbasevalue": 1, "curtime": 1,
        "bits": "xyz", "height": 1
    }})", PREV_HASH));
    EXPECT_FALSE(bad_bits.has_value());

    auto bad_tx = parse_block_template(std::format(R"({{
        "version": 1, "previousblockhash": "{}", "coinbasevalue": 1, "curtime": 1,
        "bits": "207fffff", "height": 1,
        "transactions": [{{"data": "0g", "txid": "{}"}}]
    }})", PREV_HASH, TXID));
    EXPECT_FALSE(bad_tx.has_value());

    EXPECT_FALSE(parse_block_template("not json").has_value());
}

/**
 * @brief Выход coinbase равен coinbasevalue ноды, комиссии не удваиваются
 */
TEST_F(RpcClientTest, CoinbasePaysExactlyCoinbaseValue) {
    const std::string response = std::format(R"({{
        "version": 536870912, "previousblockhash": "{}", "coinbasevalue": 625000226,
        "curtime": 1700000000, "bits": "207fffff", "height": 101,
        "transactions": [{{"data": "0100", "txid": "{}", "fee": 226}}]
    }})", PREV_HASH, TXID);

    auto tmpl = parse_block_template(response);
    ASSERT_TRUE(tmpl.has_value()) << tmpl.error().message;

    BlockAssembler assembler{AssemblerConfig{}};
    const Bytes en1(16, 0x00);
    const Bytes en2(4, 0x00);
    auto coinbase = assembler.build_coinbase(*tmpl, "mipcBbFg9gMiCh81Kj8tqqdgoZub1ZJRfn", en1, en2);
    ASSERT_TRUE(coinbase.has_value()) << coinbase.error().message;

    // scriptSig, sequence(4), число выходов(1), затем value
    const std::size_t value_offset = coinbase->script_sig_offset + coinbase->script_sig_size + 4 + 1;
    EXPECT_EQ(read_le64(coinbase->raw.data() + value_offset), 625000226ULL);
}

TEST_F(RpcClientTest, FeesAboveCoinbaseValueRejected) {
    auto tmpl = parse_block_template(std::format(R"({{
        "version": 1, "previousblockhash": "{}", "coinbasevalue": 100, "curtime": 1,
        "bits": "207fffff", "height": 1,
        "transactions": [{{"data": "00", "txid": "{}", "fee": 101}}]
    }})", PREV_HASH, TXID));
    ASSERT_FALSE(tmpl.has_value());
    EXPECT_EQ(tmpl.error().code, ErrorCode::RpcParseError);
}

TEST_F(RpcClientTest, ConfigUrl) {
    RpcConfig config;
    config.host = "10.0.0.5";
    config.port = 18443;
    EXPECT_EQ(config.get_url(), "http://10.0.0.5:18443/");
}

/**
 * @brief Недоступная нода даёт ошибку, а не исключение
 */
TEST_F(RpcClientTest, UnreachableNodeReportsError) {
    RpcConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.timeout = 2;

    RpcClient client(config);
    auto tmpl = client.get_block_template();
    ASSERT_FALSE(tmpl.has_value());
    EXPECT_TRUE(tmpl.error().code == ErrorCode::RpcConnectionFailed ||
                tmpl.error().code == ErrorCode::NetworkTimeout);

    EXPECT_FALSE(client.submit_block("00").has_value());
    EXPECT_FALSE(client.ping().has_value());
}

} // namespace bchpool::tests
