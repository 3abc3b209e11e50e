// =============================================================================
// mtc - Pipeline Configuration Implementation
// =============================================================================

#include "mtc/pipeline/pipeline_config.h"

#include <algorithm>
#include <thread>

namespace mtc::pipeline {

std::size_t recommendedParallelism() noexcept {
    const unsigned int hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 1;
    }
    return std::min<std::size_t>(hwThreads, kMaxAutoParallelism);
}

VoidResult PipelineConfig::validate() const {
    if (maxParallelism == 0) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             "max parallelism must be greater than zero");
    }
    if (fixedChunkBytes == 0 && memoryBudgetBytes == 0) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             "memory budget must be greater than zero when chunk size is automatic");
    }
    return makeVoidSuccess();
}

}  // namespace mtc::pipeline
