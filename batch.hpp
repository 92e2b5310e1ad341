#pragma once
#include <optional>
#include <string>
#include <vector>

#include "pipeline.hpp"

namespace mathwords {

struct BatchItem {
    std::string input;
    std::optional<bool> isMathML;   // unset = LaTeX
};

// ------------------------------------------------------------
// BatchCoordinator
//
// Converts items in order with one ensureReady(). Stops at the first
// failure; results is only written when every item succeeded.
// ------------------------------------------------------------
class BatchCoordinator {
public:
    explicit BatchCoordinator(ConversionPipeline& pipeline);

    bool convertBatch(const std::vector<BatchItem>& items,
                      const std::string& speechStyle,
                      engine::DisplayMode displayMode,
                      std::vector<std::string>& results,
                      ErrorInfo* err);

private:
    ConversionPipeline& pipeline_;
};

} // namespace mathwords
