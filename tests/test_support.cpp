// Silences raylib's logger for the whole test run.
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

#include <raylib.h>

class QuietLogListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(const Catch::TestRunInfo&) override {
        SetTraceLogLevel(LOG_NONE);
    }
};

CATCH_REGISTER_LISTENER(QuietLogListener)
