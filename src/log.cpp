#include <diff-server/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <memory>
#include <utility>

namespace diff_server {

namespace {

constexpr auto logger_name = "diff-server";

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name)) return existing;
    auto created = spdlog::stderr_color_mt(logger_name);
    created->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%n] [%t] %v");
    return created;
}

}  // anonymous namespace

auto logger() -> spdlog::logger& {
    static auto instance = make_logger();
    return *instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger().set_level(level);
}

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    static constexpr auto levels = std::array{
        std::pair{std::string_view{"trace"}, spdlog::level::trace},
        std::pair{std::string_view{"debug"}, spdlog::level::debug},
        std::pair{std::string_view{"info"}, spdlog::level::info},
        std::pair{std::string_view{"warn"}, spdlog::level::warn},
        std::pair{std::string_view{"error"}, spdlog::level::err},
        std::pair{std::string_view{"critical"}, spdlog::level::critical},
        std::pair{std::string_view{"off"}, spdlog::level::off},
    };
    for (const auto& [label, level] : levels) {
        if (label == name) return level;
    }
    return std::nullopt;
}

}  // namespace diff_server
