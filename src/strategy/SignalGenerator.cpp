#include "strategy/SignalGenerator.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ustw {
namespace strategy {

namespace {
std::string formatPct(double value) {
    std::ostringstream oss;
    oss << std::showpos << std::fixed << std::setprecision(2) << value << "%";
    return oss.str();
}
}

SignalGenerator::SignalGenerator(SignalPolicy policy)
    : policy_(policy) {
    if (policy_.min_sample_size < 1) {
        throw std::invalid_argument("min_sample_size must be >= 1");
    }
    if (policy_.strong_win_rate < 0.0 || policy_.strong_win_rate > 1.0) {
        throw std::invalid_argument("strong_win_rate must be within [0, 1]");
    }
    if (!(policy_.confidence_sample_scale > 0.0)) {
        throw std::invalid_argument("confidence_sample_scale must be > 0");
    }
    if (policy_.medium_confidence < 0.0 || policy_.high_confidence < policy_.medium_confidence ||
        policy_.high_confidence > 1.0) {
        throw std::invalid_argument("confidence level cut-offs must satisfy 0 <= medium <= high <= 1");
    }
    if (policy_.flat_min_sample_size < 1) {
        throw std::invalid_argument("flat_min_sample_size must be >= 1");
    }
    if (policy_.flat_min_win_rate < 0.0 || policy_.flat_min_win_rate > 1.0) {
        throw std::invalid_argument("flat_min_win_rate must be within [0, 1]");
    }
}

bool SignalGenerator::hasSufficientSample(const backtest::BacktestStatistics& statistics) const {
    return statistics.win_rate.has_value() && statistics.sample_size >= policy_.min_sample_size;
}

double SignalGenerator::confidence(const backtest::BacktestStatistics& statistics) const {
    if (!hasSufficientSample(statistics)) {
        return 0.0;
    }
    const double n = static_cast<double>(statistics.sample_size);
    const double sample_factor = n / (n + policy_.confidence_sample_scale);
    return *statistics.win_rate * sample_factor;
}

FlatDayAdvice SignalGenerator::flatDayAdvice(const backtest::BacktestStatistics& flat) const {
    if (flat.sample_size < policy_.flat_min_sample_size || !flat.win_rate || !flat.average_outcome_return) {
        return FlatDayAdvice::INSUFFICIENT_DATA;
    }
    if (*flat.average_outcome_return > policy_.flat_min_average_return &&
        *flat.win_rate >= policy_.flat_min_win_rate) {
        return FlatDayAdvice::BUY;
    }
    return FlatDayAdvice::STAND_ASIDE;
}

ConfidenceLevel SignalGenerator::confidenceLevel(double confidence) const {
    if (confidence >= policy_.high_confidence) return ConfidenceLevel::HIGH;
    if (confidence >= policy_.medium_confidence) return ConfidenceLevel::MEDIUM;
    return ConfidenceLevel::LOW;
}

Signal SignalGenerator::generate(const Date& date,
                                 Percent observed_return,
                                 const analytics::ThresholdRule& rule,
                                 const backtest::BacktestStatistics& statistics,
                                 const std::string& instrument_id) const {
    Signal signal;
    signal.date = date;
    signal.instrument_id = instrument_id;
    signal.observed_return = observed_return;
    signal.rule = rule;
    signal.statistics = statistics;
    signal.bucket = rule.classify(observed_return);

    // Insufficient evidence overrides any price move
    if (!hasSufficientSample(statistics)) {
        signal.grade = Grade::HOLD;
        signal.confidence = 0.0;
        signal.confidence_level = ConfidenceLevel::LOW;
        signal.reason = "insufficient data (" + std::to_string(statistics.sample_size) +
                        " of " + std::to_string(policy_.min_sample_size) + " samples";
        if (signal.bucket != ReactionBucket::FLAT) {
            signal.reason += " on " + toString(signal.bucket) + " days";
        }
        signal.reason += ")";
        return signal;
    }

    const double win_rate = *statistics.win_rate;
    const bool strong = win_rate >= policy_.strong_win_rate;

    switch (signal.bucket) {
        case ReactionBucket::SURGE:
            signal.grade = strong ? Grade::STRONG_BUY : Grade::BUY;
            signal.reason = "trigger " + formatPct(observed_return) + " >= up threshold " +
                            formatPct(rule.up_threshold);
            break;
        case ReactionBucket::CRASH:
            signal.grade = strong ? Grade::STRONG_AVOID : Grade::AVOID;
            signal.reason = "trigger " + formatPct(observed_return) + " <= down threshold " +
                            formatPct(-rule.down_threshold);
            break;
        case ReactionBucket::FLAT:
            signal.grade = Grade::HOLD;
            signal.reason = "trigger " + formatPct(observed_return) + " within thresholds";
            break;
    }

    signal.confidence = confidence(statistics);
    signal.confidence_level = confidenceLevel(signal.confidence);
    return signal;
}

} // namespace strategy
} // namespace ustw
