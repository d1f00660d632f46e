#include "split_classifier.hpp"

namespace splitline {

SplitClass classify_split(int64_t comparison_ms,
                          int64_t split_ms,
                          int64_t diff_ms,
                          int64_t gold_ms,
                          bool running) {
    // Gold has priority over everything else
    if (!running && (gold_ms == 0 || split_ms < gold_ms)) {
        return SplitClass::Gold;
    }

    // Ahead or behind decides the colour, this segment's own pace decides
    // whether time was gained or lost
    const bool gained = split_ms <= comparison_ms;

    if (diff_ms < 0) {
        return gained ? SplitClass::AheadGaining : SplitClass::AheadLosing;
    }
    if (diff_ms > 0) {
        return gained ? SplitClass::BehindGaining : SplitClass::BehindLosing;
    }
    return SplitClass::None;
}

} // namespace splitline
