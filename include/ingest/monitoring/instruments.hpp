#pragma once

#include "ingest/monitoring/metrics_collector.hpp"
#include "ingest/monitoring/tracer.hpp"

namespace ingest::monitoring {

/**
 * @brief Observability handles passed into the pipeline services
 *
 * Either pointer may be null, in which case that concern is skipped.
 * The pointees must outlive every service holding them.
 */
struct Instruments {
    MetricsCollector* metrics = nullptr;
    Tracer* tracer = nullptr;
};

} // namespace ingest::monitoring
