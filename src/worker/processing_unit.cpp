#include "processing_unit.h"
#include "errors.h"

namespace worker {

std::vector<podflow::StoredRecord> ProcessingUnit::full_scan() {
    throw podflow::ConfigurationError("unit does not support full scans");
}

} // namespace worker
