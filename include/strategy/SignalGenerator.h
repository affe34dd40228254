#pragma once

#include <string>
#include "common/Types.h"
#include "analytics/DynamicThresholdCalculator.h"
#include "backtest/BacktestEngine.h"

namespace ustw {
namespace strategy {

struct SignalPolicy {
    int min_sample_size = 5;
    double strong_win_rate = 0.65;
    double confidence_sample_scale = 10.0;  // n at which the sample factor reaches 0.5
    double high_confidence = 0.6;
    double medium_confidence = 0.4;

    // 보합일 매수 조건
    int flat_min_sample_size = 5;
    Percent flat_min_average_return = 0.1;  // strictly above
    double flat_min_win_rate = 0.5;
};

// One day's recommendation for one outcome instrument
struct Signal {
    Date date;
    std::string instrument_id;
    Percent observed_return = 0.0;      // today's trigger move
    analytics::ThresholdRule rule;
    backtest::BacktestStatistics statistics;    // evidence matching the bucket of the move
    ReactionBucket bucket = ReactionBucket::FLAT;
    Grade grade = Grade::HOLD;
    double confidence = 0.0;            // [0, 1)
    ConfidenceLevel confidence_level = ConfidenceLevel::LOW;
    std::string reason;
};

// Grades today's trigger move against the rule and its backtested win rate.
// Total over all inputs: exactly one grade per call.
class SignalGenerator {
public:
    // Throws std::invalid_argument for an inconsistent policy
    explicit SignalGenerator(SignalPolicy policy = SignalPolicy());

    Signal generate(const Date& date,
                    Percent observed_return,
                    const analytics::ThresholdRule& rule,
                    const backtest::BacktestStatistics& statistics,
                    const std::string& instrument_id = "") const;

    // win_rate * n / (n + scale); 0 for an insufficient sample
    double confidence(const backtest::BacktestStatistics& statistics) const;
    ConfidenceLevel confidenceLevel(double confidence) const;

    bool hasSufficientSample(const backtest::BacktestStatistics& statistics) const;

    // Whether buying on a day without a triggered move has paid off historically
    FlatDayAdvice flatDayAdvice(const backtest::BacktestStatistics& flat) const;

    const SignalPolicy& policy() const { return policy_; }

private:
    SignalPolicy policy_;
};

} // namespace strategy
} // namespace ustw
