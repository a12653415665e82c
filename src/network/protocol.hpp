/**
 * @file protocol.hpp
 * @brief Протокол Stratum V1 (JSON)
 *
 * Запрос:  {"id": ..., "method": "...", "params": [...]}
 * Ответ:   {"id": ..., "result": ..., "error": null | [code, message, null]}
 * Push:    {"id": null, "method": "mining.notify" | "mining.set_difficulty", "params": [...]}
 *
 * Метод разбирается один раз на границе протокола в закрытый
 * std::variant запросов.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../mining/job.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace bchpool::network {

using json = nlohmann::json;

// =============================================================================
// Запросы клиента
// =============================================================================

struct SubscribeRequest {
    std::string user_agent;
};

struct AuthorizeRequest {
    std::string username;
    std::string password;
};

struct SubmitRequest {
    std::string worker;
    std::string job_id;
    std::string extra_nonce2;
    std::string ntime;
    std::string nonce;
};

struct GetTransactionsRequest {
    std::string job_id;
};

/**
 * @brief Известный метод с некорректными параметрами
 */
struct InvalidRequest {
    std::string method;
    std::string reason;
};

struct UnknownRequest {
    std::string method;
};

using RequestPayload = std::variant<
    SubscribeRequest,
    AuthorizeRequest,
    SubmitRequest,
    GetTransactionsRequest,
    InvalidRequest,
    UnknownRequest
>;

struct Request {
    json id;
    RequestPayload payload;
};

/**
 * @brief Разобрать одно JSON сообщение
 *
 * @return Запрос или StratumParseError, если это не JSON объект с полем method
 */
[[nodiscard]] Result<Request> parse_request(std::string_view message);

// =============================================================================
// Ответы и push сообщения
// =============================================================================

[[nodiscard]] std::string encode_result(const json& id, const json& result);

[[nodiscard]] std::string encode_error(const json& id, int code, std::string_view message);

/**
 * @brief Результат mining.subscribe
 *
 * [[["mining.set_difficulty", sid], ["mining.notify", sid]], extra_nonce1, extranonce2_size]
 */
[[nodiscard]] std::string encode_subscribe_result(const json& id,
                                                  std::string_view subscription_id,
                                                  std::string_view extra_nonce1,
                                                  std::size_t extranonce2_size);

/**
 * @brief mining.notify
 *
 * [job_id, prevhash, coinb1, coinb2, merkle_branch, version, nbits, ntime, clean_jobs]
 */
[[nodiscard]] std::string encode_notify(const mining::Job& job);

[[nodiscard]] std::string encode_set_difficulty(double difficulty);

// =============================================================================
// Username
// =============================================================================

struct Username {
    std::string address;
    std::string worker;
};

/**
 * @brief Разобрать "address[.worker]"
 *
 * Разделитель - первая точка; без неё используется default_worker.
 */
[[nodiscard]] Username parse_username(std::string_view username, std::string_view default_worker);

// =============================================================================
// Построчный буфер TCP транспорта
// =============================================================================

/**
 * @brief Накопитель входящих байт, выдающий строки без '\n'
 */
class LineBuffer {
public:
    explicit LineBuffer(std::size_t max_line_size = constants::DEFAULT_MAX_MESSAGE_SIZE);

    /**
     * @brief Добавить данные в буфер
     */
    void add_data(std::string_view data);

    /**
     * @brief Извлечь следующую полную строку ('\r' в конце отбрасывается)
     */
    [[nodiscard]] std::optional<std::string> try_parse();

    /**
     * @brief Незавершённая строка превысила максимальный размер
     */
    [[nodiscard]] bool overflow() const noexcept;

    [[nodiscard]] std::size_t buffered_size() const noexcept;

    void clear();

private:
    std::size_t max_line_size_;
    std::string buffer_;
};

} // namespace bchpool::network
