#include <namesake/ml/batch_metrics.h>

namespace namesake::ml::batchmetrics {

Metrics& get() {
    static Metrics metrics;
    return metrics;
}

} // namespace namesake::ml::batchmetrics
