#include <PathoRoi/Platform/Logging.h>
#include <PathoRoi/Core/Exception.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Patho::Roi {

namespace {

// Sinks added after creation go through this locked fan-out sink
auto SharedSinks() -> std::shared_ptr<spdlog::sinks::dist_sink_mt> {
    static auto sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
    return sinks;
}

} // anonymous namespace

auto Logger() -> std::shared_ptr<spdlog::logger> {
    static auto logger = [] {
        auto l = spdlog::get(LOGGER_NAME);
        if (!l) {
            l = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        l->sinks().push_back(SharedSinks());
        l->set_level(spdlog::level::info);
        return l;
    }();
    return logger;
}

void SetLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw InvalidArgumentException("SetLogLevel: unknown level '" + level + "'");
    }
    Logger()->set_level(parsed);
}

void AddLogFile(const std::filesystem::path& path) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
        Logger();
        SharedSinks()->add_sink(sink);
    } catch (const spdlog::spdlog_ex& e) {
        throw IOException("AddLogFile: " + std::string(e.what()));
    }
}

} // namespace Patho::Roi
