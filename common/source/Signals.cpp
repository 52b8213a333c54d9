#include "Signals.hpp"

#include <atomic>
#include <csignal>
#include <cstring>

namespace {

std::atomic<bool> g_interrupted{false};

void SignalHandler(int) {
    g_interrupted = true;
}

} // namespace

void InstallInterruptHandler() {
    g_interrupted = false;
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = SignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
}

bool InterruptRequested() {
    return g_interrupted;
}

void ClearInterruptRequest() {
    g_interrupted = false;
}
