#include "smbbench/core/cancel.hpp"

#include <atomic>

#include <signal.h>

namespace smbbench {
namespace {

std::atomic<bool> g_cancelled{false};

static_assert(std::atomic<bool>::is_always_lock_free);

void on_interrupt(int) { g_cancelled.store(true, std::memory_order_relaxed); }

}  // namespace

bool install_interrupt_handler() noexcept {
  struct sigaction sa {};
  sa.sa_handler = on_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  return ::sigaction(SIGINT, &sa, nullptr) == 0;
}

void request_cancel() noexcept { g_cancelled.store(true, std::memory_order_relaxed); }

void reset_cancel() noexcept { g_cancelled.store(false, std::memory_order_relaxed); }

bool cancel_requested() noexcept { return g_cancelled.load(std::memory_order_relaxed); }

}  // namespace smbbench
