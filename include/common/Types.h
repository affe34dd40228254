#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/Date.h"

namespace ustw {

// All returns, volatilities and thresholds are percentages (1.25 == 1.25%)
using Percent = double;
using Price = double;

struct PricePoint {
    Date date;
    Price close;
    std::optional<Price> open;
    std::optional<Price> high;
    std::optional<Price> low;

    PricePoint() : close(0) {}

    PricePoint(const Date& d, Price c)
        : date(d), close(c) {}

    PricePoint(const Date& d, Price o, Price h, Price l, Price c)
        : date(d), close(c), open(o), high(h), low(l) {}
};

// Return between two consecutive observations of one instrument
struct DailyReturn {
    Date date;
    Date previous_date;
    Percent value;

    DailyReturn() : value(0) {}
    DailyReturn(const Date& d, const Date& prev, Percent v)
        : date(d), previous_date(prev), value(v) {}
};

// Where a trigger move falls relative to a threshold rule
enum class ReactionBucket {
    SURGE,      // return >= up threshold
    CRASH,      // return <= -down threshold
    FLAT        // neither
};

// 추천 등급 (bullish -> bearish)
enum class Grade {
    STRONG_BUY,
    BUY,
    HOLD,
    AVOID,
    STRONG_AVOID
};

enum class ConfidenceLevel { LOW, MEDIUM, HIGH };

// Which trigger reaction historically produced the better outcome
enum class ReactionPreference {
    UNDETERMINED,
    CRASH,
    SURGE,
    EITHER
};

// 보합일 (no triggered move): whether the outcome is worth buying anyway
enum class FlatDayAdvice {
    INSUFFICIENT_DATA,
    BUY,
    STAND_ASIDE
};

enum class DispersionMethod {
    STANDARD_DEVIATION,     // population std-dev of day returns
    MEAN_ABSOLUTE_DEVIATION // mean |r - mean(r)|
};

enum class EntryBasis {
    PREVIOUS_CLOSE,
    OPEN
};

enum class WinRule {
    SAME_DIRECTION,
    POSITIVE_RETURN,
    HIGH_ABOVE_ENTRY
};

std::string toString(ReactionBucket bucket);
std::string toString(Grade grade);
std::string toString(ConfidenceLevel level);
std::string toString(ReactionPreference preference);
std::string toString(FlatDayAdvice advice);
std::string toString(DispersionMethod method);
std::string toString(EntryBasis basis);
std::string toString(WinRule rule);

// +1 for bullish grades, -1 for bearish, 0 for hold
int gradeDirection(Grade grade);

// 2 for strong variants, 1 for plain buy/avoid, 0 for hold
int gradeSeverity(Grade grade);

// Higher is more bullish: STRONG_AVOID=0 ... STRONG_BUY=4
int gradeBullishness(Grade grade);

} // namespace ustw
