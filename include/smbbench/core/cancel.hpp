#pragma once

namespace smbbench {

// Routes SIGINT into the cancellation flag instead of terminating, so the
// remote cleanup still runs. Returns false when the handler could not be
// installed.
bool install_interrupt_handler() noexcept;

void request_cancel() noexcept;
void reset_cancel() noexcept;
bool cancel_requested() noexcept;

}  // namespace smbbench
