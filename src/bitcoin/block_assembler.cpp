/**
 * @file block_assembler.cpp
 * @brief Реализация сборки блока
 */

#include "block_assembler.hpp"
#include "target.hpp"
#include "../core/byte_order.hpp"
#include "../core/hex.hpp"
#include "../core/primitives/merkle.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>
#include <format>

namespace bchpool::bitcoin {

namespace {

/// @brief Размер coinbase до длины scriptSig: version(4) + count(1) + prevout(36)
constexpr std::size_t INPUT_PREFIX_SIZE = 4 + 1 + 32 + 4;

// Опкоды
constexpr uint8_t OP_0 = 0x00;
constexpr uint8_t OP_1 = 0x51;
constexpr uint8_t OP_DUP = 0x76;
constexpr uint8_t OP_HASH160 = 0xa9;
constexpr uint8_t OP_EQUAL = 0x87;
constexpr uint8_t OP_EQUALVERIFY = 0x88;
constexpr uint8_t OP_CHECKSIG = 0xac;

void append_le32(Bytes& out, uint32_t value) {
    std::array<uint8_t, 4> buf;
    write_le32(buf.data(), value);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_le64(Bytes& out, uint64_t value) {
    std::array<uint8_t, 8> buf;
    write_le64(buf.data(), value);
    out.insert(out.end(), buf.begin(), buf.end());
}

[[nodiscard]] std::string be32_hex(uint32_t value) {
    return std::format("{:08x}", value);
}

} // namespace

// =============================================================================
// Вспомогательные функции
// =============================================================================

Bytes encode_height(uint32_t height) {
    if (height == 0) {
        return {OP_0};
    }
    if (height <= 16) {
        return {static_cast<uint8_t>(OP_1 + height - 1)};
    }

    // CScriptNum: little-endian, старший бит последнего байта - знак
    Bytes num;
    uint32_t value = height;
    while (value > 0) {
        num.push_back(static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
    if (num.back() & 0x80) {
        num.push_back(0x00);
    }

    Bytes result;
    result.reserve(num.size() + 1);
    result.push_back(static_cast<uint8_t>(num.size()));
    result.insert(result.end(), num.begin(), num.end());
    return result;
}

Bytes create_output_script(AddressType type, const Hash160& hash) {
    Bytes script;
    if (type == AddressType::P2SH) {
        script.reserve(constants::P2SH_SCRIPT_SIZE);
        script.push_back(OP_HASH160);
        script.push_back(static_cast<uint8_t>(hash.size()));
        script.insert(script.end(), hash.begin(), hash.end());
        script.push_back(OP_EQUAL);
        return script;
    }

    script.reserve(constants::P2PKH_SCRIPT_SIZE);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(static_cast<uint8_t>(hash.size()));
    script.insert(script.end(), hash.begin(), hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

void write_compact_size(Bytes& out, uint64_t value) {
    if (value < 0xfd) {
        out.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        out.push_back(0xfd);
        std::array<uint8_t, 2> buf;
        write_le16(buf.data(), static_cast<uint16_t>(value));
        out.insert(out.end(), buf.begin(), buf.end());
    } else if (value <= 0xffffffff) {
        out.push_back(0xfe);
        append_le32(out, static_cast<uint32_t>(value));
    } else {
        out.push_back(0xff);
        append_le64(out, value);
    }
}

std::string stratum_prevhash(const Hash256& display_hash) {
    Hash256 words = reverse_copy(display_hash);
    for (std::size_t i = 0; i < words.size(); i += 4) {
        std::reverse(words.begin() + static_cast<std::ptrdiff_t>(i),
                     words.begin() + static_cast<std::ptrdiff_t>(i + 4));
    }
    return to_hex(words);
}

// =============================================================================
// BlockAssembler
// =============================================================================

BlockAssembler::BlockAssembler(AssemblerConfig config)
    : config_(std::move(config))
{
}

Result<CoinbaseTransaction> BlockAssembler::build_coinbase(
    const BlockTemplate& tmpl,
    std::string_view payout_address,
    ByteSpan extra_nonce1,
    ByteSpan extra_nonce2
) const {
    auto address = extract_hash160(payout_address, config_.network);
    if (!address) {
        return Err<CoinbaseTransaction>(
            address.error().code,
            std::format("Адрес выплаты '{}': {}", payout_address, address.error().message)
        );
    }

    // scriptSig: высота + подпись пула + extranonce
    Bytes script_sig = encode_height(tmpl.height);
    script_sig.insert(script_sig.end(), config_.coinbase_prefix.begin(), config_.coinbase_prefix.end());
    script_sig.insert(script_sig.end(), extra_nonce1.begin(), extra_nonce1.end());
    script_sig.insert(script_sig.end(), extra_nonce2.begin(), extra_nonce2.end());
    if (script_sig.size() > config_.max_scriptsig_size) {
        script_sig.resize(config_.max_scriptsig_size);
    }

    const Bytes script_pubkey = create_output_script(address->type, address->hash);
    const int64_t value = tmpl.coinbase_value + tmpl.total_fees();

    CoinbaseTransaction tx;
    tx.raw.reserve(INPUT_PREFIX_SIZE + 9 + script_sig.size() + 4 + 1 + 8 + 1 + script_pubkey.size() + 4);

    append_le32(tx.raw, constants::TX_VERSION);
    tx.raw.push_back(0x01);
    tx.raw.insert(tx.raw.end(), 32, 0x00);
    append_le32(tx.raw, constants::COINBASE_PREVOUT_INDEX);
    write_compact_size(tx.raw, script_sig.size());
    tx.script_sig_offset = tx.raw.size();
    tx.script_sig_size = script_sig.size();
    tx.raw.insert(tx.raw.end(), script_sig.begin(), script_sig.end());
    append_le32(tx.raw, constants::COINBASE_SEQUENCE);

    tx.raw.push_back(0x01);
    append_le64(tx.raw, static_cast<uint64_t>(value));
    write_compact_size(tx.raw, script_pubkey.size());
    tx.raw.insert(tx.raw.end(), script_pubkey.begin(), script_pubkey.end());
    append_le32(tx.raw, constants::COINBASE_LOCKTIME);

    tx.txid = crypto::sha256d(tx.raw);
    return tx;
}

Result<BlockHeader> BlockAssembler::build_header(
    const BlockTemplate& tmpl,
    ByteSpan merkle_root,
    uint32_t ntime,
    uint32_t nonce
) const {
    if (merkle_root.size() != 32) {
        return Err<BlockHeader>(
            ErrorCode::BlockHeaderAssembly,
            std::format("Неверная длина merkle root: {} байт", merkle_root.size())
        );
    }

    BlockHeader header{};
    uint8_t* ptr = header.data();

    write_le32(ptr, tmpl.version);
    ptr += 4;

    // prev_hash хранится в display порядке, в заголовок идёт внутренний
    const Hash256 prev = reverse_copy(tmpl.prev_hash);
    std::copy(prev.begin(), prev.end(), ptr);
    ptr += 32;

    std::copy(merkle_root.begin(), merkle_root.end(), ptr);
    ptr += 32;

    write_le32(ptr, ntime);
    write_le32(ptr + 4, tmpl.bits);
    write_le32(ptr + 8, nonce);

    return header;
}

Bytes BlockAssembler::assemble_block(
    const BlockHeader& header,
    ByteSpan coinbase,
    const std::vector<TemplateTransaction>& transactions
) const {
    std::size_t total = header.size() + 9 + coinbase.size();
    for (const auto& tx : transactions) {
        total += tx.data.size();
    }

    Bytes block;
    block.reserve(total);
    block.insert(block.end(), header.begin(), header.end());
    write_compact_size(block, transactions.size() + 1);
    block.insert(block.end(), coinbase.begin(), coinbase.end());
    for (const auto& tx : transactions) {
        block.insert(block.end(), tx.data.begin(), tx.data.end());
    }
    return block;
}

std::vector<Hash256> BlockAssembler::coinbase_branch(const BlockTemplate& tmpl) const {
    // Соседи листа 0 не зависят от его значения
    std::vector<Hash256> leaves;
    leaves.reserve(tmpl.transactions.size() + 1);
    leaves.push_back(Hash256{});
    for (const auto& tx : tmpl.transactions) {
        leaves.push_back(reverse_copy(tx.hash));
    }
    return core::build_branch(std::move(leaves), 0).hashes;
}

Hash256 BlockAssembler::merkle_root(const BlockTemplate& tmpl, const Hash256& coinbase_txid) const {
    core::MerkleBranch branch;
    branch.hashes = coinbase_branch(tmpl);
    return branch.compute_root(coinbase_txid);
}

Result<SolutionCheck> BlockAssembler::validate_solution(
    const BlockTemplate& tmpl,
    const Hash256& merkle_root,
    uint32_t ntime,
    uint32_t nonce,
    double difficulty
) const {
    auto header = build_header(tmpl, merkle_root, ntime, nonce);
    if (!header) {
        return Forward<SolutionCheck>(header);
    }

    SolutionCheck check;
    check.header = *header;
    check.hash = crypto::sha256d(check.header);
    check.accepted = meets_target(check.hash, target_for_difficulty(difficulty));
    return check;
}

bool BlockAssembler::meets_network_target(const BlockTemplate& tmpl, const Hash256& hash) const noexcept {
    return meets_bits(hash, tmpl.bits);
}

Result<StratumJobData> BlockAssembler::create_stratum_job(
    const BlockTemplate& tmpl,
    std::string_view payout_address,
    ByteSpan extra_nonce1
) const {
    const Bytes placeholder(config_.extranonce2_size, 0x00);
    auto coinbase = build_coinbase(tmpl, payout_address, extra_nonce1, placeholder);
    if (!coinbase) {
        return Forward<StratumJobData>(coinbase);
    }

    // extra_nonce1 стоит сразу после высоты и подписи пула
    const std::size_t en1_offset = coinbase->script_sig_offset
        + encode_height(tmpl.height).size()
        + config_.coinbase_prefix.size();
    const std::size_t en2_end = en1_offset + extra_nonce1.size() + placeholder.size();

    if (en2_end > coinbase->script_sig_offset + coinbase->script_sig_size ||
        !std::equal(extra_nonce1.begin(), extra_nonce1.end(),
                    coinbase->raw.begin() + static_cast<std::ptrdiff_t>(en1_offset))) {
        return Err<StratumJobData>(
            ErrorCode::BlockCoinbaseAssembly,
            "Extranonce не помещается в scriptSig coinbase"
        );
    }

    StratumJobData job;
    job.prevhash = stratum_prevhash(tmpl.prev_hash);
    job.coinb1 = to_hex(ByteSpan(coinbase->raw.data(), en1_offset));
    job.coinb2 = to_hex(ByteSpan(coinbase->raw.data() + en2_end, coinbase->raw.size() - en2_end));

    for (const auto& hash : coinbase_branch(tmpl)) {
        job.merkle_branch.push_back(to_hex(hash));
    }

    job.version = be32_hex(tmpl.version);
    job.nbits = be32_hex(tmpl.bits);
    job.ntime = be32_hex(tmpl.curtime);
    return job;
}

} // namespace bchpool::bitcoin
