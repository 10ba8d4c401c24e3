#pragma once
#include <string>

namespace telemetry {

// Delivery of advisory text; false on failure, never throws.
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual bool send(const std::string& text) = 0;
};

struct TelegramConfig {
    std::string token;
    std::string chat_id;
    std::string base_url{"https://api.telegram.org"};
    int timeout_ms{10000};
};

// sendMessage JSON body; invalid UTF-8 in text is replaced, never thrown on
std::string telegram_payload(const std::string& chat_id, const std::string& text);

// POST /bot<token>/sendMessage, HTML parse mode
class TelegramNotifier final : public INotifier {
public:
    explicit TelegramNotifier(TelegramConfig cfg);
    bool configured() const { return !cfg_.token.empty() && !cfg_.chat_id.empty(); }
    bool send(const std::string& text) override;

private:
    TelegramConfig cfg_;
};

// Writes alerts to the log only (no credentials configured).
class LogNotifier final : public INotifier {
public:
    bool send(const std::string& text) override;
};

} // namespace telemetry
