#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include "stlaunch/common/config.hpp"
#include "stlaunch/common/global.hpp"

class Initializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        g_output_fd = STDOUT_FILENO;

        // Defaults only, a developer's config.toml must not change test results
        g_config = Config{};
        initialize_globals();
    }
};

CATCH_REGISTER_LISTENER(Initializer)
