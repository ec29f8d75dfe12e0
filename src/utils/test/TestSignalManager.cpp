#include "SignalManager.hpp"
#include <atomic>
#include <cassert>
#include <csignal>
#include <iostream>
#include <string>

static std::atomic<int> order_marker{0};
static std::string call_order;

void test_callbacks_then_final() {
    call_order.clear();
    SignalManager::register_signal(SIGUSR1, [](int) { call_order += "a"; });
    SignalManager::register_signal(SIGUSR1, [](int) { call_order += "f"; }, true);
    SignalManager::register_signal(SIGUSR1, [](int) { call_order += "b"; });
    SignalManager::setup();

    std::raise(SIGUSR1);

    assert(call_order == "abf");
    assert(SignalManager::received_count() == 1);
    std::cout << "test_callbacks_then_final passed" << std::endl;
}

void test_signal_argument() {
    SignalManager::register_signal(SIGUSR2, [](int signum) { order_marker = signum; });
    SignalManager::setup();

    std::raise(SIGUSR2);

    assert(order_marker == SIGUSR2);
    std::cout << "test_signal_argument passed" << std::endl;
}

int main() {
    test_callbacks_then_final();
    test_signal_argument();
    std::cout << "All SignalManager tests passed." << std::endl;
    return 0;
}
