#pragma once

namespace atomrt::atomics {

/**
 * @brief Logs the lock table geometry, spin backoff and per-width lock-freedom
 * of the default policy.
 */
void logCapabilities();

}
