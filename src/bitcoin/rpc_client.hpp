/**
 * @file rpc_client.hpp
 * @brief JSON-RPC клиент ноды Bitcoin Cash
 *
 * Использует libcurl для HTTP запросов, nlohmann::json для разбора ответов.
 *
 * Поддерживаемые методы:
 * - getblocktemplate: шаблон блока для майнинга
 * - submitblock: отправка найденного блока
 * - getmininginfo: сложность сети и высота
 * - getblockchaininfo: проверка соединения (--test-rpc)
 */

#pragma once

#include "node_client.hpp"

#include <memory>
#include <string>

namespace bchpool::bitcoin {

/**
 * @brief Конфигурация RPC клиента
 */
struct RpcConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 28332;
    std::string user;
    std::string password;

    /// @brief Таймаут запроса в секундах
    uint32_t timeout = 30;

    /**
     * @brief URL для RPC запросов: "http://host:port/"
     */
    [[nodiscard]] std::string get_url() const {
        return "http://" + host + ":" + std::to_string(port) + "/";
    }
};

/**
 * @brief Информация о блокчейне от getblockchaininfo
 */
struct BlockchainInfo {
    std::string chain;
    uint32_t blocks{0};
    uint32_t headers{0};
    std::string best_blockhash;
    double difficulty{0.0};
};

/**
 * @brief RPC клиент ноды
 *
 * Вызовы сериализуются внутренним мьютексом (один CURL handle).
 */
class RpcClient : public NodeClient {
public:
    explicit RpcClient(const RpcConfig& config);
    ~RpcClient() override;

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    [[nodiscard]] Result<BlockTemplate> get_block_template() override;
    [[nodiscard]] Result<void> submit_block(std::string_view block_hex) override;
    [[nodiscard]] Result<MiningInfo> get_mining_info() override;

    [[nodiscard]] Result<BlockchainInfo> get_blockchain_info();

    /**
     * @brief Проверить соединение
     */
    [[nodiscard]] Result<void> ping();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Разобрать result getblocktemplate
 *
 * Вынесено для тестов без сети.
 */
[[nodiscard]] Result<BlockTemplate> parse_block_template(std::string_view result_json);

} // namespace bchpool::bitcoin
