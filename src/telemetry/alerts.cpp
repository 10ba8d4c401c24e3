#include "telemetry/alerts.hpp"
#include <fmt/format.h>

namespace telemetry::alerts {

std::string pre_session_header(const core::LocalTime& now) {
    return fmt::format("🕒 <b>Pre-NY Session</b>\nTime: {}", core::format_hhmm(now.minute_of_day));
}

std::string liquidity_snapshot(const core::Instrument& inst, const ind::LiquidityZone& z) {
    const int p = inst.precision;
    return fmt::format("📊 <b>{} Liquidity</b>\nLow: {:.{}f}\nHigh: {:.{}f}\nLast: {:.{}f}",
                       inst.symbol, z.recent_low, p, z.recent_high, p, z.last_close, p);
}

std::string plan_triggered(const strategy::TradePlan& t, double price, int p) {
    return fmt::format("🎯 <b>{} {} setup triggered</b>\n"
                       "Price: {:.{}f}\n"
                       "Entry: {:.{}f}\nSL: {:.{}f}\nTP1: {:.{}f}\nTP: {:.{}f}\n"
                       "Confidence: {:.0f}%\n"
                       "<i>{}</i>",
                       t.symbol, core::to_string(t.side), price, p,
                       t.entry, p, t.stop_loss, p, t.take_profit1, p, t.take_profit, p,
                       t.confidence * 100.0, t.logic);
}

std::string plan_expired(const std::string& symbol, const strategy::TradePlan& t, const std::string& why) {
    return fmt::format("⌛ {} {} setup at {} expired ({})", symbol, core::to_string(t.side), t.entry, why);
}

std::string job_error(const std::string& job, const std::string& what) {
    return fmt::format("⚠️ {} error: {}", job, what);
}

} // namespace telemetry::alerts
