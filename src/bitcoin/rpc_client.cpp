/**
 * @file rpc_client.cpp
 * @brief Реализация JSON-RPC клиента ноды
 *
 * Использует libcurl для HTTP POST запросов.
 * JSON-RPC 1.0 протокол.
 */

#include "rpc_client.hpp"
#include "../core/hex.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <mutex>

namespace bchpool::bitcoin {

using json = nlohmann::json;

namespace {

/**
 * @brief Хеш в display порядке как есть (без разворота)
 */
[[nodiscard]] Result<Hash256> parse_display_hash(std::string_view hex) {
    auto bytes = from_hex(hex);
    if (!bytes || bytes->size() != 32) {
        return Err<Hash256>(ErrorCode::RpcParseError, std::format("Некорректный хеш: '{}'", hex));
    }
    Hash256 hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

/**
 * @brief Разобрать одну транзакцию шаблона
 *
 * txid предпочтительнее hash; у BCH они совпадают.
 */
[[nodiscard]] Result<TemplateTransaction> parse_transaction(const json& item) {
    TemplateTransaction tx;

    std::string id;
    if (item.contains("txid") && item["txid"].is_string()) {
        id = item["txid"].get<std::string>();
    } else if (item.contains("hash") && item["hash"].is_string()) {
        id = item["hash"].get<std::string>();
    }
    auto hash = parse_display_hash(id);
    if (!hash) {
        return Forward<TemplateTransaction>(hash);
    }
    tx.hash = *hash;

    tx.fee = item.value("fee", int64_t{0});

    auto data = from_hex(item.value("data", std::string{}));
    if (!data) {
        return Err<TemplateTransaction>(
            ErrorCode::RpcParseError,
            std::format("Некорректные данные транзакции {}: {}", id, data.error().message)
        );
    }
    tx.data = std::move(*data);
    return tx;
}

} // namespace

Result<BlockTemplate> parse_block_template(std::string_view result_json) {
    try {
        const json result = json::parse(result_json.begin(), result_json.end());

        BlockTemplate tmpl;
        tmpl.height = result.at("height").get<uint32_t>();
        tmpl.version = result.at("version").get<uint32_t>();
        tmpl.curtime = result.at("curtime").get<uint32_t>();
        const int64_t coinbase_value = result.at("coinbasevalue").get<int64_t>();

        auto bits = parse_hex_u32(result.at("bits").get<std::string>());
        if (!bits) {
            return Err<BlockTemplate>(ErrorCode::RpcParseError, "Некорректное поле bits");
        }
        tmpl.bits = *bits;

        auto prev = parse_display_hash(result.at("previousblockhash").get<std::string>());
        if (!prev) {
            return Forward<BlockTemplate>(prev);
        }
        tmpl.prev_hash = *prev;

        if (result.contains("transactions")) {
            for (const auto& item : result["transactions"]) {
                auto tx = parse_transaction(item);
                if (!tx) {
                    return Forward<BlockTemplate>(tx);
                }
                tmpl.transactions.push_back(std::move(*tx));
            }
        }

        // coinbasevalue уже включает комиссии, в шаблоне хранится только subsidy
        const int64_t fees = tmpl.total_fees();
        if (fees < 0 || fees > coinbase_value) {
            return Err<BlockTemplate>(
                ErrorCode::RpcParseError,
                std::format("Комиссии {} превышают coinbasevalue {}", fees, coinbase_value)
            );
        }
        tmpl.coinbase_value = coinbase_value - fees;
        return tmpl;
    } catch (const json::exception& e) {
        return Err<BlockTemplate>(
            ErrorCode::RpcParseError,
            std::format("Ошибка разбора getblocktemplate: {}", e.what())
        );
    }
}

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct RpcClient::Impl {
    std::string url;
    std::string userpwd;
    uint32_t timeout;
    CURL* curl = nullptr;
    std::mutex mutex;
    uint64_t next_id = 0;

    explicit Impl(const RpcConfig& config)
        : url(config.get_url())
        , userpwd(config.user + ":" + config.password)
        , timeout(config.timeout)
    {
        curl = curl_easy_init();
        if (curl) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout));
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
            curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    /**
     * @brief Выполнить RPC запрос и вернуть поле result
     */
    Result<json> call(std::string_view method, json params = json::array()) {
        std::lock_guard lock(mutex);

        if (!curl) {
            return Err<json>(ErrorCode::RpcConnectionFailed, "CURL не инициализирован");
        }

        const json request = {
            {"jsonrpc", "1.0"},
            {"id", std::format("bchpool-{}", ++next_id)},
            {"method", std::string(method)},
            {"params", std::move(params)},
        };
        const std::string body = request.dump();

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Err<json>(
                ErrorCode::NetworkTimeout,
                std::format("Таймаут RPC {} ({} с)", method, timeout)
            );
        }
        if (res != CURLE_OK) {
            return Err<json>(
                ErrorCode::RpcConnectionFailed,
                std::format("CURL ошибка: {}", curl_easy_strerror(res))
            );
        }

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        if (http_code == 401) {
            return Err<json>(ErrorCode::RpcAuthFailed);
        }

        // Нода отвечает 500 с телом JSON-RPC ошибки
        json parsed = json::parse(response, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return Err<json>(
                ErrorCode::RpcParseError,
                std::format("HTTP {}: ответ не JSON", http_code)
            );
        }

        if (parsed.contains("error") && !parsed["error"].is_null()) {
            const auto& error = parsed["error"];
            const int code = error.value("code", 0);
            const std::string message = error.value("message", std::string{"unknown"});
            const ErrorCode mapped = code == -32601 ? ErrorCode::RpcMethodNotFound
                                   : code == -32602 ? ErrorCode::RpcInvalidParams
                                   : ErrorCode::RpcInternalError;
            return Err<json>(mapped, std::format("RPC {} ошибка {}: {}", method, code, message));
        }

        if (http_code != 200) {
            return Err<json>(
                ErrorCode::RpcInternalError,
                std::format("HTTP ошибка: {}", http_code)
            );
        }

        return parsed.contains("result") ? parsed["result"] : json{};
    }
};

// =============================================================================
// RpcClient
// =============================================================================

RpcClient::RpcClient(const RpcConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

RpcClient::~RpcClient() = default;

Result<BlockTemplate> RpcClient::get_block_template() {
    auto result = impl_->call("getblocktemplate");
    if (!result) {
        return Forward<BlockTemplate>(result);
    }
    return parse_block_template(result->dump());
}

Result<void> RpcClient::submit_block(std::string_view block_hex) {
    auto result = impl_->call("submitblock", json::array({std::string(block_hex)}));
    if (!result) {
        return Err<void>(result.error().code, result.error().message);
    }

    // null означает успех, строка - причина отказа ("high-hash", "duplicate", ...)
    if (result->is_null()) {
        return {};
    }
    return Err<void>(
        ErrorCode::MiningBlockRejected,
        result->is_string() ? result->get<std::string>() : result->dump()
    );
}

Result<MiningInfo> RpcClient::get_mining_info() {
    auto result = impl_->call("getmininginfo");
    if (!result) {
        return Forward<MiningInfo>(result);
    }

    try {
        MiningInfo info;
        info.blocks = result->value("blocks", uint32_t{0});
        info.difficulty = result->value("difficulty", 0.0);
        info.network_hashps = result->value("networkhashps", 0.0);
        info.chain = result->value("chain", std::string{});
        return info;
    } catch (const json::exception& e) {
        return Err<MiningInfo>(ErrorCode::RpcParseError, e.what());
    }
}

Result<BlockchainInfo> RpcClient::get_blockchain_info() {
    auto result = impl_->call("getblockchaininfo");
    if (!result) {
        return Forward<BlockchainInfo>(result);
    }

    try {
        BlockchainInfo info;
        info.chain = result->value("chain", std::string{});
        info.blocks = result->value("blocks", uint32_t{0});
        info.headers = result->value("headers", uint32_t{0});
        info.best_blockhash = result->value("bestblockhash", std::string{});
        info.difficulty = result->value("difficulty", 0.0);
        return info;
    } catch (const json::exception& e) {
        return Err<BlockchainInfo>(ErrorCode::RpcParseError, e.what());
    }
}

Result<void> RpcClient::ping() {
    auto result = impl_->call("getnetworkinfo");
    if (!result) {
        return Err<void>(result.error().code, result.error().message);
    }
    return {};
}

} // namespace bchpool::bitcoin
