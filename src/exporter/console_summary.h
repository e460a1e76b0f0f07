#ifndef CHOPSTICKS_EXPORTER_CONSOLE_SUMMARY_H_
#define CHOPSTICKS_EXPORTER_CONSOLE_SUMMARY_H_

#include <ostream>
#include <string>

#include "metrics/summary.h"

namespace Chopsticks {

/// Human-readable end-of-run table, one row per operation type that ran
/// plus a total row, followed by completeness warnings.
std::string RenderConsoleSummary(const Summary& summary);

void PrintConsoleSummary(const Summary& summary, std::ostream& out);

} // End of namespace Chopsticks
#endif // CHOPSTICKS_EXPORTER_CONSOLE_SUMMARY_H_
