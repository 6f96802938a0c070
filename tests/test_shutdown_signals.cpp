#include "../include/shutdown_signals.hpp"
#include "test_doubles.hpp"
#include <cassert>
#include <csignal>
#include <iostream>
#include <stdexcept>

namespace {

struct LoopFixture {
    ControlParameters params;
    ScriptedTemperatureSource source{{60.0}};
    RecordingPwmOutput pwm;
    FanActuator fan{pwm, 13};
    HysteresisController controller{params, source, fan};
    ControlLoop loop{controller, params};
};

bool defaultDisposition(int signal) {
    auto previous = std::signal(signal, SIG_IGN);
    std::signal(signal, previous);
    return previous == SIG_DFL;
}

} // namespace

void test_signals_stop_loop() {
    LoopFixture term;
    {
        ShutdownSignals signals(term.loop);
        assert(ShutdownSignals::target() == &term.loop);
        std::raise(SIGTERM);
        assert(!term.loop.running());
    }

    LoopFixture interrupt;
    {
        ShutdownSignals signals(interrupt.loop);
        std::raise(SIGINT);
        assert(!interrupt.loop.running());
    }
    std::cout << "✓ SIGTERM and SIGINT stop the loop" << std::endl;
}

void test_scope_exit_restores_defaults() {
    LoopFixture fixture;
    {
        ShutdownSignals signals(fixture.loop);
        assert(!defaultDisposition(SIGTERM));
        assert(!defaultDisposition(SIGINT));
    }
    assert(ShutdownSignals::target() == nullptr);
    assert(defaultDisposition(SIGTERM));
    assert(defaultDisposition(SIGINT));
    assert(fixture.loop.running());
    std::cout << "✓ Leaving scope restores default handlers" << std::endl;
}

void test_unwinding_detaches_loop() {
    bool caught = false;
    try {
        LoopFixture fixture;
        ShutdownSignals signals(fixture.loop);
        throw std::invalid_argument("Invalid fan speed");
    } catch (const std::invalid_argument&) {
        caught = true;
    }
    assert(caught);
    assert(ShutdownSignals::target() == nullptr);
    assert(defaultDisposition(SIGTERM));
    assert(defaultDisposition(SIGINT));
    std::cout << "✓ Exception unwinding detaches the loop" << std::endl;
}

void test_single_owner() {
    LoopFixture first;
    LoopFixture second;
    ShutdownSignals signals(first.loop);

    bool threw = false;
    try {
        ShutdownSignals other(second.loop);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(ShutdownSignals::target() == &first.loop);
    std::cout << "✓ Only one loop receives signals" << std::endl;
}

int main() {
    std::cout << "Testing ShutdownSignals..." << std::endl;

    test_signals_stop_loop();
    test_scope_exit_restores_defaults();
    test_unwinding_detaches_loop();
    test_single_owner();

    std::cout << "✅ All ShutdownSignals tests passed!" << std::endl;
    return 0;
}
