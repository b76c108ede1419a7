#include "logger.hpp"
#include "cfg/cfg.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

namespace sigq::logger {
namespace {
constexpr char SYSLOG_LOGGER_NAME[] = "sigqueue_syslog";
constexpr char CONSOLE_LOGGER_NAME[] = "sigqueue_console";
constexpr char SYSLOG_IDENT[] = "sigqueue-master";
} // namespace

void init(const cfg::cfg &cfg)
{
    const auto g = cfg.section(cfg::GENERAL_SECTION);
    auto type = static_cast<types>(g->get<int>("log_type"));
    auto priority = static_cast<priorities>(g->get<int>("log_priority"));

    switch (type) {
    case console: {
        spdlog::drop(SYSLOG_LOGGER_NAME);
        auto console_logger = spdlog::get(CONSOLE_LOGGER_NAME);
        if (!console_logger)
            console_logger = spdlog::stdout_color_mt(CONSOLE_LOGGER_NAME);
        spdlog::set_default_logger(console_logger);
        break;
    }
    case syslog: {
        auto facility = static_cast<facilities>(g->get<int>("log_facility"));
        spdlog::drop(CONSOLE_LOGGER_NAME);
        spdlog::drop(SYSLOG_LOGGER_NAME);
        auto syslog_logger = spdlog::syslog_logger_mt(SYSLOG_LOGGER_NAME, SYSLOG_IDENT, LOG_PID, facility);
        spdlog::set_default_logger(syslog_logger);
        break;
    }
    }

    spdlog::set_level(static_cast<spdlog::level::level_enum>(priority));
}

} // namespace sigq::logger
