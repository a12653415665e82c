/**
 * @file node_client.hpp
 * @brief Интерфейс ноды Bitcoin Cash и данные шаблона блока
 *
 * Шаблон блока неизменяем после получения и разделяется заданиями
 * через std::shared_ptr<const BlockTemplate>.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bchpool::bitcoin {

/**
 * @brief Транзакция-кандидат из getblocktemplate
 */
struct TemplateTransaction {
    /// @brief txid в display порядке (как в RPC)
    Hash256 hash{};

    /// @brief Комиссия в satoshi
    int64_t fee{0};

    /// @brief Сериализованная транзакция
    Bytes data;
};

/**
 * @brief Шаблон блока от ноды
 */
struct BlockTemplate {
    uint32_t height{0};

    /// @brief Хеш предыдущего блока в display порядке
    Hash256 prev_hash{};

    uint32_t bits{0};
    uint32_t curtime{0};
    uint32_t version{0};

    /// @brief Награда за блок (subsidy) в satoshi, без комиссий
    ///
    /// coinbasevalue из getblocktemplate включает комиссии, parse_block_template их вычитает.
    int64_t coinbase_value{0};

    std::vector<TemplateTransaction> transactions;

    /**
     * @brief Сумма комиссий транзакций-кандидатов
     */
    [[nodiscard]] int64_t total_fees() const noexcept {
        int64_t sum = 0;
        for (const auto& tx : transactions) {
            sum += tx.fee;
        }
        return sum;
    }
};

using BlockTemplatePtr = std::shared_ptr<const BlockTemplate>;

/**
 * @brief Ответ getmininginfo
 */
struct MiningInfo {
    uint32_t blocks{0};
    double difficulty{0.0};
    double network_hashps{0.0};
    std::string chain;
};

/**
 * @brief Клиент ноды
 *
 * Таймаут запроса считается ошибкой (NetworkTimeout), а не зависанием.
 */
class NodeClient {
public:
    virtual ~NodeClient() = default;

    [[nodiscard]] virtual Result<BlockTemplate> get_block_template() = 0;

    /**
     * @brief Отправить блок
     *
     * @return Ошибка MiningBlockRejected с причиной от ноды при отклонении
     */
    [[nodiscard]] virtual Result<void> submit_block(std::string_view block_hex) = 0;

    [[nodiscard]] virtual Result<MiningInfo> get_mining_info() = 0;
};

} // namespace bchpool::bitcoin
