#include "SignalManager.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> registry;
static std::mutex registry_mutex;
static std::atomic<int> received{0};

static void dispatch(int signum) {
    received.fetch_add(1);
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = registry.find(signum);
    if (it == registry.end()) {
        return;
    }
    for (auto& cb : it->second.callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        (*it->second.final_callback)(signum);
    }
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    if (is_final) {
        registry[signum].final_callback = std::move(cb);
    } else {
        registry[signum].callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    received.store(0);
    for (const auto& kv : registry) {
        std::signal(kv.first, dispatch);
    }
}

int received_count() {
    return received.load();
}

}
