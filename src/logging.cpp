#include "logging.hpp"
#include "config.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>
#include <vector>

namespace scoopdeck {

namespace {

constexpr std::size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
constexpr std::size_t LOG_FILE_COUNT = 3;

} // anonymous namespace

bool is_valid_log_level(const std::string& level) {
    if (level == "off") return true;
    return spdlog::level::from_str(level) != spdlog::level::off;
}

std::shared_ptr<spdlog::logger> init_logging(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
        config.color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    console->set_pattern("%^[%l]%$ %v");
    sinks.push_back(console);

    std::string file_problem;
    if (!config.log_file.empty()) {
        std::filesystem::path path(config.log_file);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        if (ec) {
            file_problem = "cannot create " + path.parent_path().string() + ": " + ec.message();
        } else {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                file_problem = e.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("scoopdeck", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_problem.empty()) {
        spdlog::warn("file logging disabled: {}", file_problem);
    }
    spdlog::debug("logger initialized (level={})", config.log_level);
    return logger;
}

} // namespace scoopdeck
