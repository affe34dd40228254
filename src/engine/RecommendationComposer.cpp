#include "engine/RecommendationComposer.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "engine/WorkerPool.h"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <thread>

namespace ustw {
namespace engine {

RecommendationComposer::RecommendationComposer(EngineConfig config)
    : config_(config)
    , estimator_(config.volatility_window, config.dispersion)
    , threshold_calculator_(config.thresholdScaling())
    , backtest_engine_(config.backtestOptions())
    , signal_generator_(config.signalPolicy()) {
    if (config_.evaluation_days < 1) {
        throw std::invalid_argument("evaluation_days must be >= 1");
    }
    if (config_.confirmation_days < config_.evaluation_days) {
        throw std::invalid_argument("confirmation_days must be >= evaluation_days");
    }
    if (config_.max_workers < 0) {
        throw std::invalid_argument("max_workers must be >= 0");
    }
}

int RecommendationComposer::historyLookbackDays() const {
    // trading -> calendar days, with slack for holidays
    return (config_.volatility_window + 2) * 2 + 10;
}

MarketStatus RecommendationComposer::assessMarket(const PriceSeries& trigger,
                                                  const std::optional<Date>& as_of) const {
    const size_t required = static_cast<size_t>(config_.volatility_window) + 2;
    if (trigger.empty()) {
        throw InsufficientHistory(trigger.instrumentId() + ": empty trigger series", required, 0);
    }

    const auto idx = as_of ? trigger.indexOnOrBefore(*as_of) : std::optional<size_t>(trigger.size() - 1);
    if (!idx) {
        throw InsufficientHistory(trigger.instrumentId() + ": no observation on or before " +
                                  as_of->toString(), required, 0);
    }
    if (*idx + 1 < required) {
        throw InsufficientHistory(
            trigger.instrumentId() + ": need " + std::to_string(required) +
                " observations through the as-of date, have " + std::to_string(*idx + 1),
            required, *idx + 1);
    }

    MarketStatus market;
    market.trigger_id = trigger.instrumentId();
    market.as_of = trigger[*idx].date;
    market.observed_return = trigger.returnAt(*idx);
    // 당일 변동이 자기 임계값을 키우지 않도록 전일까지의 변동성 사용
    market.volatility = estimator_.estimateAt(trigger, *idx - 1);
    market.rule = threshold_calculator_.compute(market.volatility);
    market.bucket = market.rule.classify(market.observed_return);
    market.evaluation_window = DateRange(market.as_of.addDays(-config_.evaluation_days),
                                         market.as_of.addDays(-1));
    market.confirmation_window = DateRange(market.as_of.addDays(-config_.confirmation_days),
                                           market.as_of.addDays(-1));
    return market;
}

InstrumentEvaluation RecommendationComposer::evaluateInstrument(const MarketStatus& market,
                                                                const PriceSeries& trigger,
                                                                const PriceSeries& outcome) const {
    const PriceSeries known_outcome = outcome.truncatedAt(market.as_of);

    InstrumentEvaluation evaluation;
    evaluation.instrument_id = outcome.instrumentId();
    evaluation.display_name = outcome.displayName();

    const PriceSeries known_trigger = trigger.truncatedAt(market.as_of);
    auto backtestOver = [&](const DateRange& window) {
        if (config_.rolling_threshold) {
            return backtest_engine_.runRolling(known_trigger, known_outcome, estimator_,
                                               threshold_calculator_, window);
        }
        return backtest_engine_.run(known_trigger, known_outcome, market.rule, window);
    };
    evaluation.backtest = backtestOver(market.evaluation_window);
    evaluation.confirmation = backtestOver(market.confirmation_window);

    // 오늘 변동과 같은 종류의 과거 이벤트로만 판단 (보합일은 전체)
    const backtest::BacktestStatistics& matched = evaluation.backtest.matching(market.bucket);
    evaluation.signal = signal_generator_.generate(market.as_of, market.observed_return, market.rule,
                                                   matched, evaluation.instrument_id);
    evaluation.preference = backtest::BacktestEngine::preferredReaction(evaluation.backtest,
                                                                        config_.preference_margin);
    evaluation.confirmation_preference =
        backtest::BacktestEngine::preferredReaction(evaluation.confirmation, config_.preference_margin);
    evaluation.confirmed_preference = backtest::BacktestEngine::confirmedReaction(
        evaluation.preference, evaluation.confirmation_preference);
    evaluation.flat_advice = signal_generator_.flatDayAdvice(evaluation.backtest.flat);

    LOG_DEBUG("{}: {} events ({} surge / {} crash), {} unpaired, grade {}", evaluation.instrument_id,
              evaluation.backtest.combined.sample_size, evaluation.backtest.surge.sample_size,
              evaluation.backtest.crash.sample_size, evaluation.backtest.skipped_pairings,
              toString(evaluation.signal.grade));
    if (!matched.sufficient()) {
        LOG_WARN("{}: insufficient {} sample ({} events, need {})", evaluation.instrument_id,
                 toString(market.bucket), matched.sample_size, config_.min_sample_size);
    }
    return evaluation;
}

size_t RecommendationComposer::workerCount(size_t jobs) const {
    size_t workers = static_cast<size_t>(config_.max_workers);
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

template <typename Task>
RecommendationSet RecommendationComposer::runBatch(const MarketStatus& market, size_t count, Task task) const {
    RecommendationSet result;
    result.market = market;
    if (count == 0) {
        return result;
    }

    // One slot per instrument; each slot is written by exactly one worker
    std::vector<std::optional<InstrumentEvaluation>> evaluations(count);
    std::vector<std::optional<InstrumentFailure>> failures(count);
    parallelFor(count, workerCount(count), [&](size_t i) {
        try {
            evaluations[i] = task(i);
        } catch (const std::exception& e) {
            failures[i] = InstrumentFailure{task.instrumentId(i), e.what()};
        }
    });

    for (size_t i = 0; i < count; ++i) {
        if (evaluations[i]) {
            result.ranked.push_back(std::move(*evaluations[i]));
        } else if (failures[i]) {
            LOG_WARN("Instrument {} could not be evaluated: {}", failures[i]->instrument_id, failures[i]->reason);
            result.failures.push_back(std::move(*failures[i]));
        }
    }

    rank(result.ranked);
    std::sort(result.failures.begin(), result.failures.end(),
              [](const InstrumentFailure& a, const InstrumentFailure& b) { return a.instrument_id < b.instrument_id; });

    for (const auto& e : result.ranked) {
        const auto& stats = e.signal.statistics;
        Logger::getInstance().logSignal(e.signal.date.toString(), e.instrument_id, toString(e.signal.grade),
                                        e.signal.confidence, stats.sample_size,
                                        stats.sufficient() ? stats.win_rate : std::nullopt);
    }
    LOG_INFO("Composed {} recommendations for {} ({} failed)", result.ranked.size(),
             market.as_of.toString(), result.failures.size());
    return result;
}

namespace {
void logMarket(const MarketStatus& market) {
    LOG_INFO("{} {} {:+.2f}% ({}), vol {:.2f}%, thresholds +{:.2f}% / -{:.2f}%",
             market.trigger_id, market.as_of.toString(), market.observed_return, toString(market.bucket),
             market.volatility.value, market.rule.up_threshold, market.rule.down_threshold);
}

struct SeriesTask {
    const RecommendationComposer& composer;
    const MarketStatus& market;
    const PriceSeries& trigger;
    const std::vector<PriceSeries>& outcomes;

    InstrumentEvaluation operator()(size_t i) const {
        return composer.evaluateInstrument(market, trigger, outcomes[i]);
    }
    std::string instrumentId(size_t i) const { return outcomes[i].instrumentId(); }
};

struct ProviderTask {
    const RecommendationComposer& composer;
    const MarketStatus& market;
    const PriceSeries& trigger;
    data::IPriceHistoryProvider& provider;
    const std::vector<std::string>& ids;
    DateRange outcome_range;

    InstrumentEvaluation operator()(size_t i) const {
        const PriceSeries outcome = provider.fetch(ids[i], outcome_range);
        return composer.evaluateInstrument(market, trigger, outcome);
    }
    std::string instrumentId(size_t i) const { return ids[i]; }
};
}

RecommendationSet RecommendationComposer::compose(const PriceSeries& trigger,
                                                  const std::vector<PriceSeries>& outcomes,
                                                  const std::optional<Date>& as_of) const {
    const MarketStatus market = assessMarket(trigger, as_of);
    logMarket(market);
    return runBatch(market, outcomes.size(), SeriesTask{*this, market, trigger, outcomes});
}

RecommendationSet RecommendationComposer::compose(data::IPriceHistoryProvider& provider,
                                                  const std::string& trigger_id,
                                                  const std::vector<std::string>& outcome_ids,
                                                  const std::optional<Date>& as_of) const {
    std::optional<DateRange> trigger_range;
    if (as_of) {
        trigger_range = DateRange(as_of->addDays(-(config_.confirmation_days + historyLookbackDays())), *as_of);
    }
    const PriceSeries trigger = provider.fetch(trigger_id, trigger_range);

    const MarketStatus market = assessMarket(trigger, as_of);
    logMarket(market);

    // Previous close of the first paired session must be available too
    const DateRange outcome_range(market.confirmation_window.start.addDays(-10), market.as_of);
    return runBatch(market, outcome_ids.size(),
                    ProviderTask{*this, market, trigger, provider, outcome_ids, outcome_range});
}

bool RecommendationComposer::ranksBefore(const InstrumentEvaluation& a, const InstrumentEvaluation& b) {
    if (a.signal.confidence != b.signal.confidence) {
        return a.signal.confidence > b.signal.confidence;
    }
    const int sev_a = gradeSeverity(a.signal.grade);
    const int sev_b = gradeSeverity(b.signal.grade);
    if (sev_a != sev_b) {
        return sev_a > sev_b;
    }
    return a.instrument_id < b.instrument_id;
}

void RecommendationComposer::rank(std::vector<InstrumentEvaluation>& evaluations) {
    std::stable_sort(evaluations.begin(), evaluations.end(), ranksBefore);
}

} // namespace engine
} // namespace ustw
