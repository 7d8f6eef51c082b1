#include "interrupt.h"

#include <atomic>
#include <csignal>

#include <glog/logging.h>

namespace Braid {

namespace {

std::atomic<CancellationToken*> g_interrupt_target{nullptr};

void HandleInterrupt(int /*signum*/) {
    CancellationToken* token = g_interrupt_target.load(std::memory_order_acquire);
    if (token != nullptr) {
        token->Cancel();
    }
}

} // namespace

bool InstallInterruptHandlers(MergeMode mode, CancellationToken* token) {
    if (mode != MergeMode::kConcurrent || token == nullptr) {
        return false;
    }
    g_interrupt_target.store(token, std::memory_order_release);
    if (std::signal(SIGINT, HandleInterrupt) == SIG_ERR ||
        std::signal(SIGTERM, HandleInterrupt) == SIG_ERR) {
        LOG(WARNING) << "[Interrupt]: could not install SIGINT/SIGTERM handlers";
        RestoreInterruptHandlers();
        return false;
    }
    return true;
}

void RestoreInterruptHandlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_interrupt_target.store(nullptr, std::memory_order_release);
}

} // namespace Braid
