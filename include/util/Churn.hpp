// Shared counter for recent /proc read failures and skipped record lines
#pragma once

#include <chrono>

namespace psistat::util {

enum class ChurnKind { Read, Parse };

// Record a churn event of a given kind at 'now'.
void note_churn(ChurnKind kind);

// Count events in the last 'ms' milliseconds for a specific kind.
[[nodiscard]] int count_recent_kind_ms(ChurnKind kind, int ms);

// Forget everything recorded so far.
void reset_churn();

} // namespace psistat::util
