/**
 * @file types.hpp
 * @brief Базовые типы для BCH Solo Pool
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (SHA256d, block hash, txid)
 * - Hash160: 20-байтный хеш для адресов
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bchpool {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Хранится во внутреннем порядке байт (little-endian, как в протоколе).
 * Для отображения (explorer, RPC) порядок байт разворачивается.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief 160-битный хеш (20 байт)
 *
 * RIPEMD160(SHA256(pubkey)) или хеш скрипта в P2KH/P2SH адресах.
 */
using Hash160 = std::array<uint8_t, 20>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Используется вместо исключений: каждая операция, которая может
 * завершиться неудачей, возвращает Result<T>.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,
    NetworkSendFailed = 202,
    NetworkRecvFailed = 203,

    // Ошибки RPC ноды (300-399)
    RpcConnectionFailed = 300,
    RpcAuthFailed = 301,
    RpcParseError = 302,
    RpcMethodNotFound = 303,
    RpcInvalidParams = 304,
    RpcInternalError = 305,

    // Ошибки майнинга (500-599)
    MiningInvalidJob = 500,
    MiningInvalidNonce = 501,
    MiningStaleJob = 502,
    MiningBlockRejected = 503,
    MiningInvalidShare = 504,

    // Ошибки адресов и сборки блока (600-699)
    AddressInvalidPrefix = 600,
    AddressInvalidChecksum = 601,
    AddressInvalidLength = 602,
    AddressInvalidVersion = 603,
    AddressInvalidCharacter = 604,
    BlockHeaderAssembly = 610,
    BlockCoinbaseAssembly = 611,
    BlockInvalidTemplate = 612,

    // Криптографические ошибки (700-799)
    CryptoHashError = 700,
    CryptoInvalidLength = 701,

    // Системные ошибки (800-899)
    SystemOutOfMemory = 800,
    SystemIOError = 801,

    // Ошибки Stratum и хранилища (900-999)
    StratumParseError = 900,
    StratumUnknownMethod = 901,
    StratumInvalidParams = 902,
    StratumUnauthorized = 903,
    StratumNotSubscribed = 904,
    PersistenceFailure = 950,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения к сети";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::NetworkSendFailed: return "Ошибка отправки данных";
        case ErrorCode::NetworkRecvFailed: return "Ошибка получения данных";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к RPC";
        case ErrorCode::RpcAuthFailed: return "Ошибка авторизации RPC";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcMethodNotFound: return "RPC метод не найден";
        case ErrorCode::RpcInvalidParams: return "Некорректные параметры RPC";
        case ErrorCode::RpcInternalError: return "Внутренняя ошибка RPC";
        case ErrorCode::MiningInvalidJob: return "Некорректное задание майнинга";
        case ErrorCode::MiningInvalidNonce: return "Некорректный nonce";
        case ErrorCode::MiningStaleJob: return "Устаревшее задание";
        case ErrorCode::MiningBlockRejected: return "Блок отклонён";
        case ErrorCode::MiningInvalidShare: return "Некорректный share";
        case ErrorCode::AddressInvalidPrefix: return "Неизвестный префикс адреса";
        case ErrorCode::AddressInvalidChecksum: return "Неверная контрольная сумма адреса";
        case ErrorCode::AddressInvalidLength: return "Неверная длина адреса";
        case ErrorCode::AddressInvalidVersion: return "Неизвестная версия адреса";
        case ErrorCode::AddressInvalidCharacter: return "Недопустимый символ в адресе";
        case ErrorCode::BlockHeaderAssembly: return "Ошибка сборки заголовка блока";
        case ErrorCode::BlockCoinbaseAssembly: return "Ошибка сборки coinbase";
        case ErrorCode::BlockInvalidTemplate: return "Некорректный шаблон блока";
        case ErrorCode::CryptoHashError: return "Ошибка хеширования";
        case ErrorCode::CryptoInvalidLength: return "Некорректная длина данных";
        case ErrorCode::SystemOutOfMemory: return "Недостаточно памяти";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        case ErrorCode::StratumParseError: return "Некорректное сообщение Stratum";
        case ErrorCode::StratumUnknownMethod: return "Неизвестный метод Stratum";
        case ErrorCode::StratumInvalidParams: return "Некорректные параметры Stratum";
        case ErrorCode::StratumUnauthorized: return "Майнер не авторизован";
        case ErrorCode::StratumNotSubscribed: return "Сессия не подписана";
        case ErrorCode::PersistenceFailure: return "Ошибка хранилища";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Проверка: ошибка относится к декодированию адреса
 */
[[nodiscard]] constexpr bool is_address_error(ErrorCode code) noexcept {
    return code >= ErrorCode::AddressInvalidPrefix &&
           code <= ErrorCode::AddressInvalidCharacter;
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 */
struct Error {
    ErrorCode code;
    std::string message;

    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @code
 * auto decoded = bitcoin::decode_cashaddr("bchtest:qq...");
 * if (!decoded) {
 *     log::warning("Auth", decoded.error().message);
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Перебросить ошибку одного Result в Result другого типа
 */
template<typename T, typename U>
[[nodiscard]] Result<T> Forward(const Result<U>& failed) {
    return std::unexpected(failed.error());
}

// =============================================================================
// Concepts
// =============================================================================

/**
 * @brief Concept для байтовых контейнеров
 */
template<typename T>
concept ByteContainer = requires(T t) {
    { t.data() } -> std::convertible_to<const uint8_t*>;
    { t.size() } -> std::convertible_to<std::size_t>;
};

} // namespace bchpool
