#pragma once

#include <vector>
#include <string>
#include <functional>
#include <optional>
#include "common/Types.h"
#include "common/PriceSeries.h"
#include "analytics/VolatilityEstimator.h"
#include "analytics/DynamicThresholdCalculator.h"

namespace ustw {
namespace backtest {

// One historical trigger day paired with the outcome instrument's reaction
struct BacktestEvent {
    Date trigger_date;
    Percent trigger_return = 0.0;
    ReactionBucket bucket = ReactionBucket::FLAT;
    analytics::ThresholdRule rule;      // rule that fired (per-day in rolling mode)

    Date outcome_date;                  // entry day: next outcome trading day
    Date exit_date;                     // close of the last holding day
    Price entry_price = 0.0;
    Price exit_price = 0.0;
    Price max_high = 0.0;               // highest high over the holding window
    Percent outcome_return = 0.0;
    bool win = false;

    // +1 surge, -1 crash, 0 flat
    int direction() const {
        if (bucket == ReactionBucket::SURGE) return 1;
        if (bucket == ReactionBucket::CRASH) return -1;
        return 0;
    }
};

enum class StatisticsStatus {
    SUFFICIENT,
    INSUFFICIENT_SAMPLE     // first-class "insufficient data" state, not an error
};

struct BacktestStatistics {
    int sample_size = 0;
    int win_count = 0;
    std::optional<double> win_rate;                 // [0,1], empty when sample_size == 0
    std::optional<Percent> average_outcome_return;  // empty when sample_size == 0
    analytics::ThresholdRule rule;
    DateRange window;
    int min_sample_size = 0;
    StatisticsStatus status = StatisticsStatus::INSUFFICIENT_SAMPLE;

    bool sufficient() const { return status == StatisticsStatus::SUFFICIENT; }
    int lossCount() const { return sample_size - win_count; }
};

struct BacktestReport {
    std::vector<BacktestEvent> events;  // triggered days only (surge + crash)
    BacktestStatistics combined;        // surge + crash
    BacktestStatistics surge;
    BacktestStatistics crash;
    BacktestStatistics flat;            // non-triggered days, for the breakdown only
    int skipped_pairings = 0;           // triggered days with no usable outcome observation
    int skipped_without_rule = 0;       // rolling mode: not enough history for a rule

    // Evidence for a move in `bucket`: the same-bucket statistics for surge/crash,
    // the combined triggered statistics for a flat day
    const BacktestStatistics& matching(ReactionBucket bucket) const {
        switch (bucket) {
            case ReactionBucket::SURGE: return surge;
            case ReactionBucket::CRASH: return crash;
            case ReactionBucket::FLAT: break;
        }
        return combined;
    }
};

using OutcomePredicate = std::function<bool(const BacktestEvent&)>;

struct BacktestOptions {
    int holding_days = 1;
    int max_pairing_gap_days = 4;
    int min_sample_size = 5;
    EntryBasis entry_basis = EntryBasis::PREVIOUS_CLOSE;
    WinRule win_rule = WinRule::SAME_DIRECTION;
};

// Replays trigger-instrument history against a threshold rule and measures
// how the outcome instrument reacted on its next trading day(s).
// Deterministic: identical inputs always produce identical reports.
class BacktestEngine {
public:
    // Throws std::invalid_argument for holding_days < 1, max_pairing_gap_days < 1, min_sample_size < 1
    explicit BacktestEngine(BacktestOptions options = BacktestOptions());

    // Overrides the configured win rule
    void setOutcomePredicate(OutcomePredicate predicate);

    // Fixed rule over every trigger day inside `window`
    BacktestReport run(const PriceSeries& trigger,
                       const PriceSeries& outcome,
                       const analytics::ThresholdRule& rule,
                       const DateRange& window) const;

    // Point-in-time rule per trigger day, from volatility through the previous observation
    BacktestReport runRolling(const PriceSeries& trigger,
                              const PriceSeries& outcome,
                              const analytics::VolatilityEstimator& estimator,
                              const analytics::DynamicThresholdCalculator& calculator,
                              const DateRange& window) const;

    static OutcomePredicate predicateFor(WinRule rule);

    // Crash-bucket vs surge-bucket average outcome; EITHER when closer than margin
    static ReactionPreference preferredReaction(const BacktestReport& report, double margin);

    // Agreement of two windows: UNDETERMINED if either lacks data, EITHER if either
    // window is EITHER, the shared side when both agree, otherwise UNDETERMINED
    static ReactionPreference confirmedReaction(ReactionPreference primary, ReactionPreference secondary);

    const BacktestOptions& options() const { return options_; }

private:
    struct PairedOutcome {
        Date outcome_date;
        Date exit_date;
        Price entry_price;
        Price exit_price;
        Price max_high;
    };

    std::optional<PairedOutcome> pairOutcome(const PriceSeries& outcome, const Date& trigger_date) const;

    // Pairs one trigger day; returns false when the outcome cannot be formed
    bool recordDay(const PriceSeries& trigger, const PriceSeries& outcome, size_t trigger_index,
                   const analytics::ThresholdRule& rule,
                   std::vector<BacktestEvent>& triggered,
                   std::vector<BacktestEvent>& flat) const;

    BacktestStatistics aggregate(const std::vector<BacktestEvent>& events,
                                 const analytics::ThresholdRule& rule,
                                 const DateRange& window) const;

    BacktestReport summarize(std::vector<BacktestEvent> triggered,
                             const std::vector<BacktestEvent>& flat,
                             const analytics::ThresholdRule& rule,
                             const DateRange& window) const;

    BacktestOptions options_;
    OutcomePredicate predicate_;
};

} // namespace backtest
} // namespace ustw
