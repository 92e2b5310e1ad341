#include "batch.hpp"
#include "logger.hpp"

#include <mutex>

namespace mathwords {

BatchCoordinator::BatchCoordinator(ConversionPipeline& pipeline)
    : pipeline_(pipeline) {}

bool BatchCoordinator::convertBatch(const std::vector<BatchItem>& items,
                                    const std::string& speechStyle,
                                    engine::DisplayMode displayMode,
                                    std::vector<std::string>& results,
                                    ErrorInfo* err) {
    if (items.empty()) {
        if (err) *err = makeError(ErrorKind::Validation, "ERR_EMPTY_BATCH", "Batch cannot be empty");
        return false;
    }

    std::vector<ConversionRequest> requests;
    requests.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); i++) {
        const BatchItem& item = items[i];
        if (isBlank(item.input)) {
            if (err) *err = makeError(ErrorKind::Validation, "ERR_EMPTY_INPUT",
                                      "Input cannot be empty (item " + std::to_string(i) + ")");
            return false;
        }
        ConversionRequest request;
        request.input = item.input;
        request.kind = item.isMathML.value_or(false) ? InputKind::MathML : InputKind::LaTeX;
        request.speechStyle = speechStyle;
        request.displayMode = displayMode;
        requests.push_back(std::move(request));
    }

    std::unique_lock<std::mutex> lock;
    if (std::mutex* m = pipeline_.conversionLock()) {
        lock = std::unique_lock<std::mutex>(*m, std::defer_lock);
        if (!acquireLock(lock, "conversion lock", err)) return false;
    }

    if (!pipeline_.initializer().ensureReady(speechStyle, err)) return false;

    std::vector<std::string> out;
    out.reserve(requests.size());
    for (std::size_t i = 0; i < requests.size(); i++) {
        std::string text;
        if (!pipeline_.render(requests[i], text, err)) {
            LOG_DEBUG("Batch", "Item " + std::to_string(i) + " failed, batch aborted");
            return false;
        }
        out.push_back(std::move(text));
    }

    LOG_DEBUG("Batch", "Converted " + std::to_string(out.size()) + " items");
    results = std::move(out);
    return true;
}

} // namespace mathwords
