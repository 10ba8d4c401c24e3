#pragma once
#include <string>
#include "core/clock.hpp"
#include "core/types.hpp"
#include "indicators/liquidity_zone.hpp"
#include "strategy/trade_plan.hpp"

namespace telemetry::alerts {

std::string pre_session_header(const core::LocalTime& now);
std::string liquidity_snapshot(const core::Instrument& inst, const ind::LiquidityZone& z);
std::string plan_triggered(const strategy::TradePlan& plan, double price, int precision);
std::string plan_expired(const std::string& symbol, const strategy::TradePlan& plan, const std::string& why);
std::string job_error(const std::string& job, const std::string& what);

} // namespace telemetry::alerts
