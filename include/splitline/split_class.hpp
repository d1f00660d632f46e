#pragma once

namespace splitline {

// How a split compares against its baselines. The UI picks a colour per value.
enum class SplitClass {
    None,           // Even with the comparison, or nothing to compare
    Gold,           // New best segment
    AheadGaining,   // Ahead, and this segment was faster than the comparison
    AheadLosing,    // Ahead, but this segment lost time
    BehindGaining,  // Behind, but this segment gained time
    BehindLosing    // Behind, and this segment lost time
};

inline const char* to_string(SplitClass split_class) {
    switch (split_class) {
        case SplitClass::Gold:          return "gold";
        case SplitClass::AheadGaining:  return "ahead-gaining";
        case SplitClass::AheadLosing:   return "ahead-losing";
        case SplitClass::BehindGaining: return "behind-gaining";
        case SplitClass::BehindLosing:  return "behind-losing";
        case SplitClass::None:          break;
    }
    return "none";
}

} // namespace splitline
