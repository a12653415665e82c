/**
 * @file protocol.cpp
 * @brief Реализация протокола Stratum
 */

#include "protocol.hpp"

#include <format>

namespace bchpool::network {

namespace {

bool all_strings(const json& params, std::size_t count) {
    if (!params.is_array() || params.size() < count) {
        return false;
    }
    for (std::size_t i = 0; i < count; ++i) {
        if (!params[i].is_string()) {
            return false;
        }
    }
    return true;
}

RequestPayload parse_payload(const std::string& method, const json& params) {
    if (method == "mining.subscribe") {
        SubscribeRequest request;
        if (params.is_array() && !params.empty() && params[0].is_string()) {
            request.user_agent = params[0].get<std::string>();
        }
        return request;
    }

    if (method == "mining.authorize") {
        if (!all_strings(params, 1)) {
            return InvalidRequest{method, "username required"};
        }
        AuthorizeRequest request;
        request.username = params[0].get<std::string>();
        if (params.size() > 1 && params[1].is_string()) {
            request.password = params[1].get<std::string>();
        }
        return request;
    }

    if (method == "mining.submit") {
        if (!all_strings(params, 5)) {
            return InvalidRequest{method, "expected [worker, job_id, extranonce2, ntime, nonce]"};
        }
        return SubmitRequest{
            params[0].get<std::string>(),
            params[1].get<std::string>(),
            params[2].get<std::string>(),
            params[3].get<std::string>(),
            params[4].get<std::string>()
        };
    }

    if (method == "mining.get_transactions") {
        GetTransactionsRequest request;
        if (params.is_array() && !params.empty() && params[0].is_string()) {
            request.job_id = params[0].get<std::string>();
        }
        return request;
    }

    return UnknownRequest{method};
}

std::string dump(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

// =============================================================================
// Разбор
// =============================================================================

Result<Request> parse_request(std::string_view message) {
    json document = json::parse(message, nullptr, false);
    if (document.is_discarded()) {
        return Err<Request>(ErrorCode::StratumParseError, "Некорректный JSON");
    }
    if (!document.is_object()) {
        return Err<Request>(ErrorCode::StratumParseError, "Сообщение должно быть JSON объектом");
    }

    auto method = document.find("method");
    if (method == document.end() || !method->is_string()) {
        return Err<Request>(ErrorCode::StratumParseError, "Отсутствует поле method");
    }

    Request request;
    if (auto id = document.find("id"); id != document.end()) {
        request.id = *id;
    }

    json params = json::array();
    if (auto it = document.find("params"); it != document.end()) {
        params = *it;
    }

    request.payload = parse_payload(method->get<std::string>(), params);
    return request;
}

// =============================================================================
// Кодирование
// =============================================================================

std::string encode_result(const json& id, const json& result) {
    return dump(json{{"id", id}, {"result", result}, {"error", nullptr}});
}

std::string encode_error(const json& id, int code, std::string_view message) {
    return dump(json{
        {"id", id},
        {"result", nullptr},
        {"error", json::array({code, std::string(message), nullptr})}
    });
}

std::string encode_subscribe_result(const json& id,
                                    std::string_view subscription_id,
                                    std::string_view extra_nonce1,
                                    std::size_t extranonce2_size) {
    json subscriptions = json::array({
        json::array({"mining.set_difficulty", std::string(subscription_id)}),
        json::array({"mining.notify", std::string(subscription_id)})
    });
    return encode_result(id, json::array({subscriptions, std::string(extra_nonce1), extranonce2_size}));
}

std::string encode_notify(const mining::Job& job) {
    const auto& s = job.stratum;
    json params = json::array({
        job.job_id,
        s.prevhash,
        s.coinb1,
        s.coinb2,
        s.merkle_branch,
        s.version,
        s.nbits,
        s.ntime,
        job.clean_jobs
    });
    return dump(json{{"id", nullptr}, {"method", "mining.notify"}, {"params", params}});
}

std::string encode_set_difficulty(double difficulty) {
    return dump(json{
        {"id", nullptr},
        {"method", "mining.set_difficulty"},
        {"params", json::array({difficulty})}
    });
}

// =============================================================================
// Username
// =============================================================================

Username parse_username(std::string_view username, std::string_view default_worker) {
    auto dot = username.find('.');
    if (dot == std::string_view::npos) {
        return {std::string(username), std::string(default_worker)};
    }

    std::string worker(username.substr(dot + 1));
    if (worker.empty()) {
        worker = default_worker;
    }
    return {std::string(username.substr(0, dot)), std::move(worker)};
}

// =============================================================================
// LineBuffer
// =============================================================================

LineBuffer::LineBuffer(std::size_t max_line_size)
    : max_line_size_(max_line_size) {}

void LineBuffer::add_data(std::string_view data) {
    buffer_.append(data);
}

std::optional<std::string> LineBuffer::try_parse() {
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            return std::nullopt;
        }

        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Пустые строки пропускаются
        if (!line.empty()) {
            return line;
        }
    }
}

bool LineBuffer::overflow() const noexcept {
    return buffer_.find('\n') == std::string::npos && buffer_.size() > max_line_size_;
}

std::size_t LineBuffer::buffered_size() const noexcept {
    return buffer_.size();
}

void LineBuffer::clear() {
    buffer_.clear();
}

} // namespace bchpool::network
