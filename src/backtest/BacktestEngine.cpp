#include "backtest/BacktestEngine.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ustw {
namespace backtest {

BacktestEngine::BacktestEngine(BacktestOptions options)
    : options_(options)
    , predicate_(predicateFor(options.win_rule)) {
    if (options_.holding_days < 1) {
        throw std::invalid_argument("holding_days must be >= 1");
    }
    if (options_.max_pairing_gap_days < 1) {
        throw std::invalid_argument("max_pairing_gap_days must be >= 1");
    }
    if (options_.min_sample_size < 1) {
        throw std::invalid_argument("min_sample_size must be >= 1");
    }
}

void BacktestEngine::setOutcomePredicate(OutcomePredicate predicate) {
    if (!predicate) {
        throw std::invalid_argument("Outcome predicate must be callable");
    }
    predicate_ = std::move(predicate);
}

OutcomePredicate BacktestEngine::predicateFor(WinRule rule) {
    switch (rule) {
        case WinRule::POSITIVE_RETURN:
            return [](const BacktestEvent& e) { return e.outcome_return > 0.0; };
        case WinRule::HIGH_ABOVE_ENTRY:
            // 보유 기간 중 고가가 진입가를 넘으면 승
            return [](const BacktestEvent& e) { return e.max_high > e.entry_price; };
        case WinRule::SAME_DIRECTION:
            break;
    }
    return [](const BacktestEvent& e) {
        const int dir = e.direction();
        if (dir == 0) {
            return e.outcome_return > 0.0;
        }
        return e.outcome_return * static_cast<double>(dir) > 0.0;
    };
}

std::optional<BacktestEngine::PairedOutcome> BacktestEngine::pairOutcome(
    const PriceSeries& outcome, const Date& trigger_date) const {
    const auto entry_idx = outcome.firstIndexAfter(trigger_date);
    if (!entry_idx) {
        return std::nullopt;
    }
    if (trigger_date.daysUntil(outcome[*entry_idx].date) > options_.max_pairing_gap_days) {
        // holiday misalignment: no matching outcome session
        return std::nullopt;
    }

    const size_t exit_idx = *entry_idx + static_cast<size_t>(options_.holding_days) - 1;
    if (exit_idx >= outcome.size()) {
        return std::nullopt;
    }

    PairedOutcome paired;
    if (options_.entry_basis == EntryBasis::OPEN) {
        if (!outcome[*entry_idx].open) {
            return std::nullopt;
        }
        paired.entry_price = *outcome[*entry_idx].open;
    } else {
        if (*entry_idx == 0) {
            return std::nullopt;
        }
        paired.entry_price = outcome[*entry_idx - 1].close;
    }
    if (!(paired.entry_price > 0.0)) {
        return std::nullopt;
    }

    paired.outcome_date = outcome[*entry_idx].date;
    paired.exit_date = outcome[exit_idx].date;
    paired.exit_price = outcome[exit_idx].close;
    paired.max_high = 0.0;
    for (size_t i = *entry_idx; i <= exit_idx; ++i) {
        const Price high = outcome[i].high.value_or(outcome[i].close);
        paired.max_high = std::max(paired.max_high, high);
    }
    return paired;
}

bool BacktestEngine::recordDay(const PriceSeries& trigger, const PriceSeries& outcome, size_t trigger_index,
                               const analytics::ThresholdRule& rule,
                               std::vector<BacktestEvent>& triggered,
                               std::vector<BacktestEvent>& flat) const {
    const auto paired = pairOutcome(outcome, trigger[trigger_index].date);
    if (!paired) {
        return false;
    }

    BacktestEvent event;
    event.trigger_date = trigger[trigger_index].date;
    event.trigger_return = trigger.returnAt(trigger_index);
    event.bucket = rule.classify(event.trigger_return);
    event.rule = rule;
    event.outcome_date = paired->outcome_date;
    event.exit_date = paired->exit_date;
    event.entry_price = paired->entry_price;
    event.exit_price = paired->exit_price;
    event.max_high = paired->max_high;
    event.outcome_return = (paired->exit_price / paired->entry_price - 1.0) * 100.0;
    event.win = predicate_(event);

    if (event.bucket == ReactionBucket::FLAT) {
        flat.push_back(event);
    } else {
        triggered.push_back(event);
    }
    return true;
}

BacktestReport BacktestEngine::run(const PriceSeries& trigger,
                                   const PriceSeries& outcome,
                                   const analytics::ThresholdRule& rule,
                                   const DateRange& window) const {
    std::vector<BacktestEvent> triggered;
    std::vector<BacktestEvent> flat;
    int skipped = 0;

    for (size_t i = 1; i < trigger.size(); ++i) {
        if (!window.contains(trigger[i].date)) {
            continue;
        }
        if (!recordDay(trigger, outcome, i, rule, triggered, flat)) {
            if (rule.fires(trigger.returnAt(i))) {
                ++skipped;
            }
        }
    }

    BacktestReport report = summarize(std::move(triggered), flat, rule, window);
    report.skipped_pairings = skipped;
    return report;
}

BacktestReport BacktestEngine::runRolling(const PriceSeries& trigger,
                                          const PriceSeries& outcome,
                                          const analytics::VolatilityEstimator& estimator,
                                          const analytics::DynamicThresholdCalculator& calculator,
                                          const DateRange& window) const {
    std::vector<BacktestEvent> triggered;
    std::vector<BacktestEvent> flat;
    int skipped = 0;
    int without_rule = 0;
    analytics::ThresholdRule latest_rule;

    // volatility through i-1 needs window+1 points ending at i-1
    const size_t first_ruled_index = static_cast<size_t>(estimator.window()) + 1;

    for (size_t i = 1; i < trigger.size(); ++i) {
        if (!window.contains(trigger[i].date)) {
            continue;
        }
        if (i < first_ruled_index) {
            ++without_rule;
            continue;
        }

        const auto rule = calculator.compute(estimator.estimateAt(trigger, i - 1));
        latest_rule = rule;
        if (!recordDay(trigger, outcome, i, rule, triggered, flat)) {
            if (rule.fires(trigger.returnAt(i))) {
                ++skipped;
            }
        }
    }

    BacktestReport report = summarize(std::move(triggered), flat, latest_rule, window);
    report.skipped_pairings = skipped;
    report.skipped_without_rule = without_rule;
    return report;
}

BacktestReport BacktestEngine::summarize(std::vector<BacktestEvent> triggered,
                                         const std::vector<BacktestEvent>& flat,
                                         const analytics::ThresholdRule& rule,
                                         const DateRange& window) const {
    BacktestReport report;

    std::vector<BacktestEvent> surge_events;
    std::vector<BacktestEvent> crash_events;
    for (const auto& e : triggered) {
        if (e.bucket == ReactionBucket::SURGE) {
            surge_events.push_back(e);
        } else {
            crash_events.push_back(e);
        }
    }

    report.combined = aggregate(triggered, rule, window);
    report.surge = aggregate(surge_events, rule, window);
    report.crash = aggregate(crash_events, rule, window);
    report.flat = aggregate(flat, rule, window);
    report.events = std::move(triggered);
    return report;
}

BacktestStatistics BacktestEngine::aggregate(const std::vector<BacktestEvent>& events,
                                             const analytics::ThresholdRule& rule,
                                             const DateRange& window) const {
    BacktestStatistics stats;
    stats.rule = rule;
    stats.window = window;
    stats.min_sample_size = options_.min_sample_size;
    stats.sample_size = static_cast<int>(events.size());

    double sum_return = 0.0;
    for (const auto& e : events) {
        if (e.win) {
            ++stats.win_count;
        }
        sum_return += e.outcome_return;
    }

    if (stats.sample_size > 0) {
        stats.win_rate = static_cast<double>(stats.win_count) / static_cast<double>(stats.sample_size);
        stats.average_outcome_return = sum_return / static_cast<double>(stats.sample_size);
    }
    stats.status = (stats.sample_size >= options_.min_sample_size)
        ? StatisticsStatus::SUFFICIENT
        : StatisticsStatus::INSUFFICIENT_SAMPLE;
    return stats;
}

ReactionPreference BacktestEngine::preferredReaction(const BacktestReport& report, double margin) {
    if (!report.crash.average_outcome_return || !report.surge.average_outcome_return) {
        return ReactionPreference::UNDETERMINED;
    }
    const double crash_ret = *report.crash.average_outcome_return;
    const double surge_ret = *report.surge.average_outcome_return;
    if (std::abs(crash_ret - surge_ret) < margin) {
        return ReactionPreference::EITHER;
    }
    return crash_ret > surge_ret ? ReactionPreference::CRASH : ReactionPreference::SURGE;
}

ReactionPreference BacktestEngine::confirmedReaction(ReactionPreference primary, ReactionPreference secondary) {
    if (primary == ReactionPreference::UNDETERMINED || secondary == ReactionPreference::UNDETERMINED) {
        return ReactionPreference::UNDETERMINED;
    }
    if (primary == ReactionPreference::EITHER || secondary == ReactionPreference::EITHER) {
        return ReactionPreference::EITHER;
    }
    if (primary == secondary) {
        return primary;
    }
    return ReactionPreference::UNDETERMINED;
}

} // namespace backtest
} // namespace ustw
