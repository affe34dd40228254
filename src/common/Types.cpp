#include "common/Types.h"

namespace ustw {

std::string toString(ReactionBucket bucket) {
    switch (bucket) {
        case ReactionBucket::SURGE: return "surge";
        case ReactionBucket::CRASH: return "crash";
        case ReactionBucket::FLAT: return "flat";
    }
    return "flat";
}

std::string toString(Grade grade) {
    switch (grade) {
        case Grade::STRONG_BUY: return "strong-buy";
        case Grade::BUY: return "buy";
        case Grade::HOLD: return "hold";
        case Grade::AVOID: return "avoid";
        case Grade::STRONG_AVOID: return "strong-avoid";
    }
    return "hold";
}

std::string toString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::LOW: return "low";
        case ConfidenceLevel::MEDIUM: return "medium";
        case ConfidenceLevel::HIGH: return "high";
    }
    return "low";
}

std::string toString(ReactionPreference preference) {
    switch (preference) {
        case ReactionPreference::UNDETERMINED: return "undetermined";
        case ReactionPreference::CRASH: return "crash";
        case ReactionPreference::SURGE: return "surge";
        case ReactionPreference::EITHER: return "either";
    }
    return "undetermined";
}

std::string toString(FlatDayAdvice advice) {
    switch (advice) {
        case FlatDayAdvice::INSUFFICIENT_DATA: return "insufficient_data";
        case FlatDayAdvice::BUY: return "buy";
        case FlatDayAdvice::STAND_ASIDE: return "stand_aside";
    }
    return "insufficient_data";
}

std::string toString(DispersionMethod method) {
    return method == DispersionMethod::MEAN_ABSOLUTE_DEVIATION ? "mad" : "stddev";
}

std::string toString(EntryBasis basis) {
    return basis == EntryBasis::OPEN ? "open" : "previous_close";
}

std::string toString(WinRule rule) {
    switch (rule) {
        case WinRule::SAME_DIRECTION: return "same_direction";
        case WinRule::POSITIVE_RETURN: return "positive_return";
        case WinRule::HIGH_ABOVE_ENTRY: return "high_above_entry";
    }
    return "same_direction";
}

int gradeDirection(Grade grade) {
    switch (grade) {
        case Grade::STRONG_BUY:
        case Grade::BUY:
            return 1;
        case Grade::AVOID:
        case Grade::STRONG_AVOID:
            return -1;
        case Grade::HOLD:
            return 0;
    }
    return 0;
}

int gradeSeverity(Grade grade) {
    switch (grade) {
        case Grade::STRONG_BUY:
        case Grade::STRONG_AVOID:
            return 2;
        case Grade::BUY:
        case Grade::AVOID:
            return 1;
        case Grade::HOLD:
            return 0;
    }
    return 0;
}

int gradeBullishness(Grade grade) {
    switch (grade) {
        case Grade::STRONG_AVOID: return 0;
        case Grade::AVOID: return 1;
        case Grade::HOLD: return 2;
        case Grade::BUY: return 3;
        case Grade::STRONG_BUY: return 4;
    }
    return 2;
}

} // namespace ustw
