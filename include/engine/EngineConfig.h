#pragma once

#include <string>
#include "common/Types.h"
#include "analytics/DynamicThresholdCalculator.h"
#include "backtest/BacktestEngine.h"
#include "strategy/SignalGenerator.h"

namespace ustw {
namespace engine {

// 엔진 설정: every knob of one evaluation run, defaults alone are a valid run
struct EngineConfig {
    // 변동성 / 임계값
    int volatility_window = 20;
    DispersionMethod dispersion = DispersionMethod::STANDARD_DEVIATION;
    double up_multiplier = 1.0;
    double down_multiplier = 1.0;
    Percent threshold_floor = 0.7;
    Percent threshold_ceiling = 1.8;

    // 신호
    int min_sample_size = 5;
    double strong_win_rate = 0.65;
    double confidence_sample_scale = 10.0;
    Percent preference_margin = 0.5;    // crash vs surge avg-return gap below which both qualify
    Percent flat_min_average_return = 0.1;
    double flat_min_win_rate = 0.5;

    // 백테스트
    int evaluation_days = 95;           // about three months of calendar days
    int confirmation_days = 180;        // second, longer window (about six months)
    int holding_days = 1;
    int max_pairing_gap_days = 4;
    EntryBasis entry_basis = EntryBasis::PREVIOUS_CLOSE;
    WinRule win_rule = WinRule::SAME_DIRECTION;
    bool rolling_threshold = false;

    // 배치
    int max_workers = 0;                // 0 = hardware concurrency

    analytics::ThresholdScaling thresholdScaling() const {
        analytics::ThresholdScaling s;
        s.up_multiplier = up_multiplier;
        s.down_multiplier = down_multiplier;
        s.floor = threshold_floor;
        s.ceiling = threshold_ceiling;
        return s;
    }

    backtest::BacktestOptions backtestOptions() const {
        backtest::BacktestOptions o;
        o.holding_days = holding_days;
        o.max_pairing_gap_days = max_pairing_gap_days;
        o.min_sample_size = min_sample_size;
        o.entry_basis = entry_basis;
        o.win_rule = win_rule;
        return o;
    }

    strategy::SignalPolicy signalPolicy() const {
        strategy::SignalPolicy p;
        p.min_sample_size = min_sample_size;
        p.strong_win_rate = strong_win_rate;
        p.confidence_sample_scale = confidence_sample_scale;
        p.flat_min_sample_size = min_sample_size;
        p.flat_min_average_return = flat_min_average_return;
        p.flat_min_win_rate = flat_min_win_rate;
        return p;
    }
};

} // namespace engine
} // namespace ustw
