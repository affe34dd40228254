#include "strategy/SignalGenerator.h"
#include "TestHelpers.h"

#include <iostream>
#include <stdexcept>

using namespace ustw;
using ustw::analytics::ThresholdRule;
using ustw::backtest::BacktestStatistics;
using ustw::backtest::StatisticsStatus;
using ustw::strategy::SignalGenerator;
using ustw::strategy::SignalPolicy;

namespace {
const Date kToday(2024, 6, 3);
const ThresholdRule kRule(1.2, 1.2, 1.2, Date(2024, 5, 31));

BacktestStatistics stats(int n, int wins) {
    BacktestStatistics s;
    s.sample_size = n;
    s.win_count = wins;
    s.min_sample_size = 5;
    if (n > 0) {
        s.win_rate = static_cast<double>(wins) / n;
        s.average_outcome_return = 0.4;
    }
    s.status = n >= 5 ? StatisticsStatus::SUFFICIENT : StatisticsStatus::INSUFFICIENT_SAMPLE;
    return s;
}
}

int main() {
    const SignalGenerator generator;

    // surge + strong win rate
    {
        const auto s = generator.generate(kToday, 2.0, kRule, stats(20, 15), "TSMC");
        USTW_CHECK(s.grade == Grade::STRONG_BUY);
        USTW_CHECK(s.bucket == ReactionBucket::SURGE);
        USTW_CHECK(s.instrument_id == "TSMC");
        // 0.75 * 20 / 30
        USTW_CHECK_NEAR(s.confidence, 0.5, 1e-12);
        USTW_CHECK(s.confidence_level == ConfidenceLevel::MEDIUM);
        USTW_CHECK(!s.reason.empty());
    }

    // surge + ordinary win rate
    {
        const auto s = generator.generate(kToday, 1.5, kRule, stats(20, 11));
        USTW_CHECK(s.grade == Grade::BUY);
    }

    // crash branches
    {
        USTW_CHECK(generator.generate(kToday, -2.0, kRule, stats(20, 15)).grade == Grade::STRONG_AVOID);
        USTW_CHECK(generator.generate(kToday, -1.3, kRule, stats(20, 10)).grade == Grade::AVOID);
    }

    // inside thresholds
    {
        const auto s = generator.generate(kToday, 0.3, kRule, stats(20, 15));
        USTW_CHECK(s.grade == Grade::HOLD);
        USTW_CHECK(s.bucket == ReactionBucket::FLAT);
        USTW_CHECK(s.confidence > 0.0);
    }

    // insufficient evidence overrides a large move
    {
        const auto s = generator.generate(kToday, 5.0, kRule, stats(3, 3));
        USTW_CHECK(s.grade == Grade::HOLD);
        USTW_CHECK(s.confidence == 0.0);
        USTW_CHECK(s.confidence_level == ConfidenceLevel::LOW);
        USTW_CHECK(s.reason.find("insufficient") != std::string::npos);

        const auto none = generator.generate(kToday, -5.0, kRule, stats(0, 0));
        USTW_CHECK(none.grade == Grade::HOLD);
        USTW_CHECK(none.confidence == 0.0);
    }

    // Larger moves never produce a more bearish grade
    {
        int previous = -1;
        for (double r = -4.0; r <= 4.0; r += 0.1) {
            const int bullishness = gradeBullishness(generator.generate(kToday, r, kRule, stats(20, 14)).grade);
            USTW_CHECK(bullishness >= previous);
            previous = bullishness;
        }
    }

    // More samples at the same win rate -> higher confidence
    {
        const double small = generator.confidence(stats(10, 7));
        const double large = generator.confidence(stats(40, 28));
        USTW_CHECK(large > small);
        USTW_CHECK(large < 0.7);
        USTW_CHECK(generator.confidenceLevel(0.65) == ConfidenceLevel::HIGH);
        USTW_CHECK(generator.confidenceLevel(0.39) == ConfidenceLevel::LOW);
    }

    // 보합일: average above +0.1% and at least half up
    {
        auto flat = stats(8, 5);
        flat.average_outcome_return = 0.25;
        USTW_CHECK(generator.flatDayAdvice(flat) == FlatDayAdvice::BUY);

        flat.average_outcome_return = 0.1;
        USTW_CHECK(generator.flatDayAdvice(flat) == FlatDayAdvice::STAND_ASIDE);

        auto losing = stats(8, 3);
        losing.average_outcome_return = 0.3;
        USTW_CHECK(generator.flatDayAdvice(losing) == FlatDayAdvice::STAND_ASIDE);

        auto half = stats(8, 4);
        half.average_outcome_return = 0.3;
        USTW_CHECK(generator.flatDayAdvice(half) == FlatDayAdvice::BUY);

        USTW_CHECK(generator.flatDayAdvice(stats(4, 4)) == FlatDayAdvice::INSUFFICIENT_DATA);
        USTW_CHECK(generator.flatDayAdvice(stats(0, 0)) == FlatDayAdvice::INSUFFICIENT_DATA);
    }

    {
        SignalPolicy bad;
        bad.flat_min_win_rate = -0.1;
        bool threw = false;
        try {
            SignalGenerator invalid(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        USTW_CHECK(threw);
    }

    {
        SignalPolicy bad;
        bad.strong_win_rate = 1.5;
        bool threw = false;
        try {
            SignalGenerator invalid(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        USTW_CHECK(threw);
    }

    std::cout << "[TEST] SignalGenerator PASSED\n";
    return 0;
}
