#include "common/PriceSeries.h"
#include "TestHelpers.h"

#include <iostream>
#include <stdexcept>

using namespace ustw;

int main() {
    // 금요일, 월요일, 화요일
    const PriceSeries series("QQQ", {
        PricePoint(Date(2024, 1, 5), 100.0),
        PricePoint(Date(2024, 1, 8), 103.0),
        PricePoint(Date(2024, 1, 9), 101.97),
    }, "Nasdaq-100");

    USTW_CHECK(series.size() == 3);
    USTW_CHECK(series.displayName() == "Nasdaq-100");

    // weekend gap is not a move: Monday's return is against Friday
    USTW_CHECK_NEAR(series.returnAt(1), 3.0, 1e-9);
    USTW_CHECK_NEAR(series.returnAt(2), -1.0, 1e-9);

    {
        const auto returns = series.dailyReturns();
        USTW_CHECK(returns.size() == 2);
        USTW_CHECK(returns[0].date == Date(2024, 1, 8));
        USTW_CHECK(returns[0].previous_date == Date(2024, 1, 5));
    }

    USTW_CHECK(series.indexOnOrBefore(Date(2024, 1, 7)).value() == 0);
    USTW_CHECK(!series.indexOnOrBefore(Date(2024, 1, 4)));
    USTW_CHECK(series.firstIndexAfter(Date(2024, 1, 5)).value() == 1);
    USTW_CHECK(!series.firstIndexAfter(Date(2024, 1, 9)));
    USTW_CHECK(series.indexOf(Date(2024, 1, 9)).value() == 2);
    USTW_CHECK(!series.indexOf(Date(2024, 1, 6)));

    {
        const auto truncated = series.truncatedAt(Date(2024, 1, 8));
        USTW_CHECK(truncated.size() == 2);
        USTW_CHECK(truncated.back().date == Date(2024, 1, 8));
        USTW_CHECK(truncated.instrumentId() == "QQQ");
    }

    {
        const auto sliced = series.slice(DateRange(Date(2024, 1, 6), Date(2024, 1, 31)));
        USTW_CHECK(sliced.size() == 2);
        USTW_CHECK(sliced.front().date == Date(2024, 1, 8));
    }

    bool threw = false;
    try {
        series.returnAt(0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    USTW_CHECK(threw);

    threw = false;
    try {
        PriceSeries bad("BAD", {PricePoint(Date(2024, 1, 8), 10.0), PricePoint(Date(2024, 1, 5), 11.0)});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    USTW_CHECK(threw);

    threw = false;
    try {
        PriceSeries bad("BAD", {PricePoint(Date(2024, 1, 5), 10.0), PricePoint(Date(2024, 1, 5), 11.0)});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    USTW_CHECK(threw);

    threw = false;
    try {
        PriceSeries bad("BAD", {PricePoint(Date(2024, 1, 5), 0.0)});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    USTW_CHECK(threw);

    std::cout << "[TEST] PriceSeries PASSED\n";
    return 0;
}
