#include <modelflux/model/end_detector.h>

namespace modelflux::model {

TokenCountEndDetector::Signal TokenCountEndDetector::observe(std::uint64_t tokenCount) {
    const bool reset = last_.has_value() && tokenCount <= *last_;
    last_ = tokenCount;
    return reset ? Signal::NewGeneration : Signal::Continue;
}

} // namespace modelflux::model
