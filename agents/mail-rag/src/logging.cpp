#include "../include/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

void init_logging(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
        std::filesystem::path p(file);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    }
    auto logger = std::make_shared<spdlog::logger>("mail-rag", sinks.begin(), sinks.end());
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    logger->set_level(lvl);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
