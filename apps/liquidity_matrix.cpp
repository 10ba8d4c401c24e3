#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <pthread.h>
#include <spdlog/spdlog.h>

#include "app/config.hpp"
#include "app/monitor.hpp"
#include "app/scheduler.hpp"
#include "data/twelvedata_feed.hpp"
#include "telemetry/telegram_notifier.hpp"

static void usage() {
    std::cout << "Usage: liquidity_matrix [config.json] [--once | --pre-session]\n"
                 "  --once         run one monitoring cycle and exit\n"
                 "  --pre-session  send the pre-session snapshot and exit\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    bool once = false, pre_only = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--once") once = true;
        else if (a == "--pre-session") pre_only = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else config_path = a;
    }

    app::AppConfig cfg = app::default_config();
    if (!config_path.empty()) {
        std::string err;
        if (!app::load_config(config_path, cfg, &err)) {
            std::cerr << "Config error (" << config_path << "): " << err << "\n";
            return 2;
        }
    }
    app::apply_env(cfg);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    data::TwelveDataFeed feed(cfg.feed);
    telemetry::TelegramNotifier telegram(cfg.telegram);
    telemetry::LogNotifier log_only;
    telemetry::INotifier& notifier = telegram.configured()
        ? static_cast<telemetry::INotifier&>(telegram) : log_only;
    if (!telegram.configured()) spdlog::warn("TELEGRAM_TOKEN/TELEGRAM_CHAT_ID not set, alerts go to the log");

    const int offset = cfg.utc_offset_minutes;
    const int pre_minute = cfg.schedule.pre_session_minute;
    const int interval = cfg.schedule.monitor_interval_min;
    app::MonitorContext ctx(std::move(cfg), feed, notifier);

    if (pre_only) {
        app::run_pre_session(ctx, std::chrono::system_clock::now());
        return 0;
    }
    if (once) {
        const auto st = app::run_monitor_cycle(ctx, std::chrono::system_clock::now());
        spdlog::info("cycle: in_session={} armed={} triggered={} expired={} skipped={}",
                     st.in_session, st.armed, st.triggered, st.expired, st.skipped);
        return 0;
    }

    // SIGINT/SIGTERM are taken by a waiter thread, not by an async handler
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

    app::Scheduler sched(offset);
    sched.add_daily("pre_session", pre_minute,
                    [&ctx](core::TimePoint now) { app::run_pre_session(ctx, now); });
    sched.add_interval("monitor", interval, [&ctx](core::TimePoint now) {
        const auto st = app::run_monitor_cycle(ctx, now);
        if (st.in_session)
            spdlog::info("cycle: armed={} triggered={} expired={} skipped={} pending={}",
                         st.armed, st.triggered, st.expired, st.skipped, ctx.tracker.armed_count());
    });

    std::thread waiter([&sched, sigs]() {
        int sig = 0;
        sigwait(&sigs, &sig);
        spdlog::info("signal {} received, shutting down", sig);
        sched.stop();
    });

    spdlog::info("Liquidity Matrix bot running ({} instruments, every {} min)",
                 ctx.cfg.instruments.size(), interval);
    sched.run();

    waiter.join();
    return 0;
}
