/**
 * @file block_assembler.hpp
 * @brief Сборка coinbase, заголовка и полного блока
 *
 * Структура coinbase транзакции:
 *
 * [0-3]    version         = 01 00 00 00
 * [4]      input_count     = 01
 * [5-36]   prev_tx_hash    = 00 x 32
 * [37-40]  prev_tx_index   = FF FF FF FF
 * [41]     scriptsig_len
 *          scriptsig       = BIP34 height + "/BCHPool/" + extra_nonce1 + extra_nonce2
 *                            (обрезается до max_scriptsig_size)
 *          sequence        = FF FF FF FF
 *          output_count    = 01
 *          value           = coinbase_value + комиссии (LE, 8 байт)
 *          script_len + scriptPubKey (P2KH 25 байт или P2SH 23 байта)
 *          locktime        = 00 00 00 00
 *
 * Для Stratum coinbase делится вокруг extranonce: coinb1 + en1 + en2 + coinb2.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "address.hpp"
#include "node_client.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace bchpool::bitcoin {

using BlockHeader = std::array<uint8_t, constants::BLOCK_HEADER_SIZE>;

/**
 * @brief Параметры сборки блока
 */
struct AssemblerConfig {
    Network network = Network::Testnet;
    std::string coinbase_prefix = std::string(constants::DEFAULT_COINBASE_PREFIX);
    std::size_t max_scriptsig_size = constants::MAX_SCRIPTSIG_SIZE;
    std::size_t extranonce2_size = constants::EXTRANONCE2_SIZE;
};

/**
 * @brief Сериализованная coinbase транзакция
 */
struct CoinbaseTransaction {
    Bytes raw;

    /// @brief Смещение scriptSig в raw (после compact size длины)
    std::size_t script_sig_offset{0};
    std::size_t script_sig_size{0};

    /// @brief txid во внутреннем порядке байт
    Hash256 txid{};
};

/**
 * @brief Поля задания в формате mining.notify
 */
struct StratumJobData {
    /// @brief prevhash: внутренний порядок, каждое 4-байтное слово развёрнуто
    std::string prevhash;
    std::string coinb1;
    std::string coinb2;

    /// @brief Соседние хеши для coinbase (internal порядок, hex)
    std::vector<std::string> merkle_branch;

    /// @brief version, nbits, ntime: big-endian hex, 8 символов
    std::string version;
    std::string nbits;
    std::string ntime;
};

/**
 * @brief Результат проверки решения
 */
struct SolutionCheck {
    BlockHeader header{};

    /// @brief SHA256d заголовка во внутреннем порядке
    Hash256 hash{};

    /// @brief Хеш не больше target сложности
    bool accepted{false};
};

/**
 * @brief Сборщик блоков
 *
 * Не имеет изменяемого состояния, безопасен для одновременного
 * использования из нескольких потоков.
 */
class BlockAssembler {
public:
    explicit BlockAssembler(AssemblerConfig config);

    [[nodiscard]] const AssemblerConfig& config() const noexcept { return config_; }

    /**
     * @brief Построить coinbase транзакцию
     *
     * @param tmpl Шаблон блока
     * @param payout_address Адрес выплаты (CashAddr или legacy)
     * @param extra_nonce1 Extranonce сессии
     * @param extra_nonce2 Extranonce майнера
     * @return Транзакция и txid, или ошибка декодирования адреса
     */
    [[nodiscard]] Result<CoinbaseTransaction> build_coinbase(
        const BlockTemplate& tmpl,
        std::string_view payout_address,
        ByteSpan extra_nonce1,
        ByteSpan extra_nonce2
    ) const;

    /**
     * @brief Собрать 80-байтный заголовок
     *
     * @param merkle_root Merkle root во внутреннем порядке, ровно 32 байта
     */
    [[nodiscard]] Result<BlockHeader> build_header(
        const BlockTemplate& tmpl,
        ByteSpan merkle_root,
        uint32_t ntime,
        uint32_t nonce
    ) const;

    /**
     * @brief Полный блок: заголовок + varint(tx count) + coinbase + транзакции шаблона
     */
    [[nodiscard]] Bytes assemble_block(
        const BlockHeader& header,
        ByteSpan coinbase,
        const std::vector<TemplateTransaction>& transactions
    ) const;

    /**
     * @brief Merkle branch для coinbase (internal порядок)
     */
    [[nodiscard]] std::vector<Hash256> coinbase_branch(const BlockTemplate& tmpl) const;

    /**
     * @brief Merkle root блока для coinbase с данным txid (internal порядок)
     */
    [[nodiscard]] Hash256 merkle_root(const BlockTemplate& tmpl, const Hash256& coinbase_txid) const;

    /**
     * @brief Проверить решение против сложности пула
     *
     * SHA256d заголовка как 256-битное число должен быть не больше
     * target_for_difficulty(difficulty).
     */
    [[nodiscard]] Result<SolutionCheck> validate_solution(
        const BlockTemplate& tmpl,
        const Hash256& merkle_root,
        uint32_t ntime,
        uint32_t nonce,
        double difficulty
    ) const;

    /**
     * @brief Хеш удовлетворяет сложности сети (bits шаблона)
     */
    [[nodiscard]] bool meets_network_target(const BlockTemplate& tmpl, const Hash256& hash) const noexcept;

    /**
     * @brief Поля mining.notify для шаблона, адреса и extra_nonce1
     */
    [[nodiscard]] Result<StratumJobData> create_stratum_job(
        const BlockTemplate& tmpl,
        std::string_view payout_address,
        ByteSpan extra_nonce1
    ) const;

private:
    AssemblerConfig config_;
};

// =============================================================================
// Вспомогательные функции
// =============================================================================

/**
 * @brief BIP34: минимальная запись высоты блока в scriptSig
 */
[[nodiscard]] Bytes encode_height(uint32_t height);

/**
 * @brief scriptPubKey для адреса: P2KH или P2SH
 */
[[nodiscard]] Bytes create_output_script(AddressType type, const Hash160& hash);

/**
 * @brief Compact size (varint) сериализация
 */
void write_compact_size(Bytes& out, uint64_t value);

/**
 * @brief prevhash в формате Stratum из display хеша
 */
[[nodiscard]] std::string stratum_prevhash(const Hash256& display_hash);

} // namespace bchpool::bitcoin
