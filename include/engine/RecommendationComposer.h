#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/PriceSeries.h"
#include "engine/EngineConfig.h"
#include "analytics/VolatilityEstimator.h"
#include "analytics/DynamicThresholdCalculator.h"
#include "backtest/BacktestEngine.h"
#include "strategy/SignalGenerator.h"
#include "data/IPriceHistoryProvider.h"

namespace ustw {
namespace engine {

// Trigger instrument state on the as-of date, shared by every outcome instrument
struct MarketStatus {
    std::string trigger_id;
    Date as_of;
    Percent observed_return = 0.0;
    ReactionBucket bucket = ReactionBucket::FLAT;
    analytics::VolatilityEstimate volatility;   // through the previous observation
    analytics::ThresholdRule rule;
    DateRange evaluation_window;
    DateRange confirmation_window;              // longer window that confirms the preference
};

struct InstrumentEvaluation {
    std::string instrument_id;
    std::string display_name;
    strategy::Signal signal;
    backtest::BacktestReport backtest;
    ReactionPreference preference = ReactionPreference::UNDETERMINED;

    backtest::BacktestReport confirmation;
    ReactionPreference confirmation_preference = ReactionPreference::UNDETERMINED;
    // 두 구간이 같은 쪽을 가리킬 때만 확정
    ReactionPreference confirmed_preference = ReactionPreference::UNDETERMINED;
    FlatDayAdvice flat_advice = FlatDayAdvice::INSUFFICIENT_DATA;
};

struct InstrumentFailure {
    std::string instrument_id;
    std::string reason;
};

struct RecommendationSet {
    MarketStatus market;
    std::vector<InstrumentEvaluation> ranked;   // confidence desc, severity desc, id asc
    std::vector<InstrumentFailure> failures;    // sorted by id
};

// Assembles volatility, threshold, backtest and signal into one ranked result.
// Holds only its configuration; every call is a pure function of its inputs.
class RecommendationComposer {
public:
    explicit RecommendationComposer(EngineConfig config = EngineConfig());

    // as_of defaults to the trigger's last date; otherwise the last observation on or before it.
    // Throws InsufficientHistory when the trigger cannot support a threshold for that day.
    MarketStatus assessMarket(const PriceSeries& trigger,
                              const std::optional<Date>& as_of = std::nullopt) const;

    // Outcome observations after the as-of date are ignored (point-in-time view)
    InstrumentEvaluation evaluateInstrument(const MarketStatus& market,
                                            const PriceSeries& trigger,
                                            const PriceSeries& outcome) const;

    RecommendationSet compose(const PriceSeries& trigger,
                              const std::vector<PriceSeries>& outcomes,
                              const std::optional<Date>& as_of = std::nullopt) const;

    // Fetches through the provider; a trigger DataUnavailable propagates,
    // outcome failures are isolated per instrument.
    RecommendationSet compose(data::IPriceHistoryProvider& provider,
                              const std::string& trigger_id,
                              const std::vector<std::string>& outcome_ids,
                              const std::optional<Date>& as_of = std::nullopt) const;

    static bool ranksBefore(const InstrumentEvaluation& a, const InstrumentEvaluation& b);
    static void rank(std::vector<InstrumentEvaluation>& evaluations);

    // Calendar days of trigger history needed before the longest backtest window
    int historyLookbackDays() const;

    const EngineConfig& config() const { return config_; }

private:
    template <typename Task>
    RecommendationSet runBatch(const MarketStatus& market, size_t count, Task task) const;

    size_t workerCount(size_t jobs) const;

    EngineConfig config_;
    analytics::VolatilityEstimator estimator_;
    analytics::DynamicThresholdCalculator threshold_calculator_;
    backtest::BacktestEngine backtest_engine_;
    strategy::SignalGenerator signal_generator_;
};

} // namespace engine
} // namespace ustw
