#pragma once
#include <csignal>
#include <functional>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run in registration order; a final callback (e.g. exit) runs last.
void register_signal(int signum, SignalCallback cb, bool is_final = false);
void setup();

// Number of signals delivered since setup()
int received_count();

}
