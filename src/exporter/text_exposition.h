#ifndef CHOPSTICKS_EXPORTER_TEXT_EXPOSITION_H_
#define CHOPSTICKS_EXPORTER_TEXT_EXPOSITION_H_

#include <string>

#include "metrics/summary.h"

namespace Chopsticks {

// Content type of the rendered exposition
extern const char kExpositionContentType[];

/**
 * Renders a Summary in the plain-text exposition format scraped by
 * Prometheus-compatible collectors. Latency histograms are emitted per
 * operation and outcome with cumulative buckets in seconds.
 */
std::string RenderTextExposition(const Summary& summary);

} // End of namespace Chopsticks
#endif // CHOPSTICKS_EXPORTER_TEXT_EXPOSITION_H_
