#include <catch2/catch_session.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <httprange/util/logger.hpp>
#include <cstdlib>
#include <string>

// Global test event listener to initialize logging
class LoggingInitializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        static bool initialized = false;
        if (initialized) return;

        httprange::logging::enable();

        // HTTPRANGE_LOG_LEVEL selects the level, warn by default
        const char* log_level_env = std::getenv("HTTPRANGE_LOG_LEVEL");
        std::string level_str = log_level_env ? log_level_env : "warn";
        if (level_str == "trace") {
            httprange::logging::set_log_level(spdlog::level::trace);
        } else if (level_str == "debug") {
            httprange::logging::set_log_level(spdlog::level::debug);
        } else if (level_str == "info") {
            httprange::logging::set_log_level(spdlog::level::info);
        } else if (level_str == "error") {
            httprange::logging::set_log_level(spdlog::level::err);
        } else if (level_str == "off") {
            httprange::logging::set_log_level(spdlog::level::off);
        } else {
            httprange::logging::set_log_level(spdlog::level::warn);
        }

        initialized = true;
        LOG_INFO("Test logging initialized. Level: {}", level_str);
    }
};

CATCH_REGISTER_LISTENER(LoggingInitializer)

int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
