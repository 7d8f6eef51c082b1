#pragma once

#include "cancellation.h"
#include "merge_job.h"

namespace Braid {

/**
 * Routes SIGINT and SIGTERM to `token` for a concurrent run.
 * Ordered runs are not interruptible and keep the default disposition, so
 * an interrupt terminates the process instead of being ignored.
 * Returns true when the handlers were installed.
 */
bool InstallInterruptHandlers(MergeMode mode, CancellationToken* token);

// Puts SIGINT and SIGTERM back to their default disposition
void RestoreInterruptHandlers();

} // namespace Braid
