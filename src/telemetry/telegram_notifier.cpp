#include "telemetry/telegram_notifier.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace telemetry {

std::string telegram_payload(const std::string& chat_id, const std::string& text) {
    const json payload = {{"chat_id", chat_id}, {"text", text}, {"parse_mode", "HTML"}};
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

TelegramNotifier::TelegramNotifier(TelegramConfig cfg) : cfg_(std::move(cfg)) {}

bool TelegramNotifier::send(const std::string& text) {
    if (!configured()) {
        spdlog::warn("telegram: token/chat id missing, message dropped");
        return false;
    }
    cpr::Response r = cpr::Post(cpr::Url{cfg_.base_url + "/bot" + cfg_.token + "/sendMessage"},
                                cpr::Header{{"Content-Type", "application/json"}},
                                cpr::Body{telegram_payload(cfg_.chat_id, text)},
                                cpr::Timeout{cfg_.timeout_ms},
                                cpr::VerifySsl{true});
    if (r.error) {
        spdlog::error("telegram send error: {}", r.error.message);
        return false;
    }
    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::error("telegram send error: HTTP {} {}", r.status_code, r.text);
        return false;
    }
    return true;
}

bool LogNotifier::send(const std::string& text) {
    spdlog::info("[alert] {}", text);
    return true;
}

} // namespace telemetry
