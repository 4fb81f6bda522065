// PolyForest Platform Layer
// timer.cpp - Scoped timing log output

#include <polyforest/core/logger.hpp>
#include <polyforest/platform/timer.hpp>

#include <utility>

namespace polyforest::platform {

ScopedTimer::ScopedTimer(const char* category, std::string label) : category_(category), label_(std::move(label)) {}

ScopedTimer::~ScopedTimer() {
    POLYFOREST_LOG_DEBUG(category_, "{} took {:.3f} ms", label_, timer_.elapsed_milliseconds());
}

}  // namespace polyforest::platform
