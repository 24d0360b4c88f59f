#include <gtest/gtest.h>
#include "Rebalancer.hpp"

using namespace portsim;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class RebalancerTest : public ::testing::Test {
protected:
    void SetUp() override {
        calendar = TradingCalendar::weekdays(makeDate(2024, 1, 1), makeDate(2025, 12, 31));
    }

    std::unique_ptr<Rebalancer> makeRebalancer(
        RebalanceConfig config,
        AccountKind kind = AccountKind::Taxable) {
        return std::make_unique<Rebalancer>(std::move(config), calendar, kind);
    }

    static RebalanceConfig calendarConfig(CalendarPeriod period) {
        RebalanceConfig config;
        config.type = RebalanceType::Calendar;
        config.period = period;
        return config;
    }

    static RebalanceConfig driftConfig(std::optional<double> absPct, std::optional<double> relPct) {
        RebalanceConfig config;
        config.type = RebalanceType::Drift;
        config.drift = DriftThresholds{absPct, relPct};
        return config;
    }

    std::shared_ptr<const TradingCalendar> calendar;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Календарный триггер
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RebalancerTest, CalendarFirstCallOnlySchedules) {
    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));

    auto first = rebalancer->shouldRebalance(makeDate(2024, 1, 2), {}, {}, false);
    EXPECT_FALSE(first.triggered);
    ASSERT_TRUE(rebalancer->getNextCalendarRebalance().has_value());
    EXPECT_EQ(*rebalancer->getNextCalendarRebalance(), makeDate(2024, 2, 1));
}

TEST_F(RebalancerTest, CalendarMonthlyFiresOnBoundary) {
    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));

    EXPECT_FALSE(rebalancer->shouldRebalance(makeDate(2024, 1, 2), {}, {}, false).triggered);
    EXPECT_FALSE(rebalancer->shouldRebalance(makeDate(2024, 1, 31), {}, {}, false).triggered);

    auto fired = rebalancer->shouldRebalance(makeDate(2024, 2, 1), {}, {}, false);
    EXPECT_TRUE(fired.triggered);
    EXPECT_EQ(fired.reason, "calendar");
    EXPECT_EQ(*rebalancer->getNextCalendarRebalance(), makeDate(2024, 3, 1));

    EXPECT_FALSE(rebalancer->shouldRebalance(makeDate(2024, 2, 2), {}, {}, false).triggered);
}

TEST_F(RebalancerTest, CalendarQuarterlyAndYearlyBoundaries) {
    auto quarterly = makeRebalancer(calendarConfig(CalendarPeriod::Quarterly));
    quarterly->shouldRebalance(makeDate(2024, 2, 15), {}, {}, false);
    EXPECT_EQ(*quarterly->getNextCalendarRebalance(), makeDate(2024, 4, 1));

    auto lastQuarter = makeRebalancer(calendarConfig(CalendarPeriod::Quarterly));
    lastQuarter->shouldRebalance(makeDate(2024, 11, 15), {}, {}, false);
    EXPECT_EQ(*lastQuarter->getNextCalendarRebalance(), makeDate(2025, 1, 1));

    auto yearly = makeRebalancer(calendarConfig(CalendarPeriod::Yearly));
    yearly->shouldRebalance(makeDate(2024, 3, 5), {}, {}, false);
    EXPECT_EQ(*yearly->getNextCalendarRebalance(), makeDate(2025, 1, 1));
}

TEST_F(RebalancerTest, CalendarWeeklyAndDaily) {
    auto weekly = makeRebalancer(calendarConfig(CalendarPeriod::Weekly));
    // Пятница + 7 = пятница
    weekly->shouldRebalance(makeDate(2024, 1, 5), {}, {}, false);
    EXPECT_EQ(*weekly->getNextCalendarRebalance(), makeDate(2024, 1, 12));

    auto daily = makeRebalancer(calendarConfig(CalendarPeriod::Daily));
    daily->shouldRebalance(makeDate(2024, 1, 5), {}, {}, false);
    EXPECT_EQ(*daily->getNextCalendarRebalance(), makeDate(2024, 1, 8));
    EXPECT_TRUE(daily->shouldRebalance(makeDate(2024, 1, 8), {}, {}, false).triggered);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Триггер по отклонению
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RebalancerTest, DriftAbsoluteThreshold) {
    WeightMap target{{"A", 0.5}, {"B", 0.5}};
    WeightMap current{{"A", 0.56}, {"B", 0.44}};

    auto tight = makeRebalancer(driftConfig(0.05, std::nullopt));
    auto decision = tight->shouldRebalance(makeDate(2024, 1, 2), current, target, false);
    EXPECT_TRUE(decision.triggered);
    EXPECT_EQ(decision.reason, "drift");

    auto loose = makeRebalancer(driftConfig(0.10, std::nullopt));
    EXPECT_FALSE(loose->shouldRebalance(makeDate(2024, 1, 2), current, target, false).triggered);
}

TEST_F(RebalancerTest, DriftRelativeThreshold) {
    WeightMap target{{"A", 0.5}, {"B", 0.5}};
    WeightMap current{{"A", 0.56}, {"B", 0.44}};

    // 0.06 / 0.5 = 12%
    auto rel10 = makeRebalancer(driftConfig(std::nullopt, 0.10));
    EXPECT_TRUE(rel10->shouldRebalance(makeDate(2024, 1, 2), current, target, false).triggered);

    auto rel20 = makeRebalancer(driftConfig(std::nullopt, 0.20));
    EXPECT_FALSE(rel20->shouldRebalance(makeDate(2024, 1, 2), current, target, false).triggered);
}

TEST_F(RebalancerTest, DriftMissingSymbolCountsAsZeroWeight) {
    WeightMap target{{"A", 0.5}, {"B", 0.5}};
    WeightMap current{{"A", 1.0}};

    auto rebalancer = makeRebalancer(driftConfig(0.05, std::nullopt));
    EXPECT_TRUE(rebalancer->shouldRebalance(makeDate(2024, 1, 2), current, target, false).triggered);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Комбинации типов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RebalancerTest, CashflowOnlyFiresOnlyOnDepositDays) {
    RebalanceConfig config;
    config.type = RebalanceType::CashflowOnly;
    auto rebalancer = makeRebalancer(config);

    WeightMap target{{"A", 0.5}, {"B", 0.5}};
    WeightMap current{{"A", 0.9}, {"B", 0.1}};

    EXPECT_FALSE(rebalancer->shouldRebalance(makeDate(2024, 1, 2), current, target, false).triggered);

    auto deposit = rebalancer->shouldRebalance(makeDate(2024, 1, 3), current, target, true);
    EXPECT_TRUE(deposit.triggered);
    EXPECT_EQ(deposit.reason, "deposit");
}

TEST_F(RebalancerTest, DepositDayFiresForOtherTypes) {
    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Yearly));

    auto decision = rebalancer->shouldRebalance(makeDate(2024, 1, 2), {}, {}, true);
    EXPECT_TRUE(decision.triggered);
    EXPECT_EQ(decision.reason, "deposit");
}

TEST_F(RebalancerTest, BothFiresOnEitherChannel) {
    RebalanceConfig config;
    config.type = RebalanceType::Both;
    config.period = CalendarPeriod::Monthly;
    config.drift = DriftThresholds{0.05, std::nullopt};
    auto rebalancer = makeRebalancer(config);

    WeightMap target{{"A", 0.5}, {"B", 0.5}};
    WeightMap balanced{{"A", 0.5}, {"B", 0.5}};
    WeightMap drifted{{"A", 0.6}, {"B", 0.4}};

    EXPECT_FALSE(rebalancer->shouldRebalance(makeDate(2024, 1, 2), balanced, target, false).triggered);
    EXPECT_EQ(rebalancer->shouldRebalance(makeDate(2024, 1, 10), drifted, target, false).reason, "drift");
    EXPECT_EQ(rebalancer->shouldRebalance(makeDate(2024, 2, 1), balanced, target, false).reason, "calendar");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Генерация сделок
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(RebalancerTest, DepositTradesFollowTargetWeights) {
    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));

    auto trades = rebalancer->generateDepositTrades(
        {{"SPY", 0.6}, {"AGG", 0.4}}, 10000.0, {{"SPY", 400.0}, {"AGG", 100.0}});

    ASSERT_EQ(trades.size(), 2u);
    for (const auto& trade : trades) {
        EXPECT_EQ(trade.side, TradeSide::Buy);
        if (trade.symbol == "SPY") {
            EXPECT_NEAR(trade.quantity, 15.0, 1e-9);
        } else {
            EXPECT_EQ(trade.symbol, "AGG");
            EXPECT_NEAR(trade.quantity, 40.0, 1e-9);
        }
    }
}

TEST_F(RebalancerTest, DepositTradesSkipZeroWeightAndMissingPrice) {
    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));

    auto trades = rebalancer->generateDepositTrades(
        {{"SPY", 0.5}, {"AGG", 0.5}, {"GLD", 0.0}}, 1000.0,
        {{"SPY", 400.0}, {"GLD", 180.0}});

    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].symbol, "SPY");
}

TEST_F(RebalancerTest, TaxAwareOrderingHarvestsLossesFirst) {
    Portfolio portfolio(3100.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("A", 10.0, 100.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(portfolio.buy("B", 20.0, 100.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(portfolio.buy("C", 1.0, 100.0, makeDate(2024, 1, 2)));

    // A: 1500 (прибыль), B: 1600 (убыток), C: 100; итого 3200
    PriceMap prices{{"A", 150.0}, {"B", 80.0}, {"C", 100.0}};
    WeightMap target{{"A", 1.0 / 3.0}, {"B", 1.0 / 3.0}, {"C", 1.0 / 3.0}};

    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));
    auto trades = rebalancer->generateRebalanceTrades(portfolio, target, prices);

    ASSERT_EQ(trades.size(), 3u);
    EXPECT_EQ(trades[0].symbol, "B");
    EXPECT_EQ(trades[0].side, TradeSide::Sell);
    EXPECT_EQ(trades[1].symbol, "C");
    EXPECT_EQ(trades[1].side, TradeSide::Buy);
    EXPECT_EQ(trades[2].symbol, "A");
    EXPECT_EQ(trades[2].side, TradeSide::Sell);

    double third = 3200.0 / 3.0;
    EXPECT_NEAR(trades[0].quantity, (1600.0 - third) / 80.0, 1e-9);
    EXPECT_NEAR(trades[1].quantity, (third - 100.0) / 100.0, 1e-9);
    EXPECT_NEAR(trades[2].quantity, (1500.0 - third) / 150.0, 1e-9);
}

TEST_F(RebalancerTest, LargestLossSoldFirst) {
    Portfolio portfolio(4000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("X", 15.0, 100.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(portfolio.buy("Y", 15.0, 100.0, makeDate(2024, 1, 2)));

    // X теряет 150, Y теряет 300, Z пустая
    PriceMap prices{{"X", 90.0}, {"Y", 80.0}, {"Z", 50.0}};
    WeightMap target{{"X", 0.2}, {"Y", 0.2}, {"Z", 0.6}};

    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly));
    auto trades = rebalancer->generateRebalanceTrades(portfolio, target, prices);

    ASSERT_GE(trades.size(), 3u);
    EXPECT_EQ(trades[0].symbol, "Y");
    EXPECT_EQ(trades[1].symbol, "X");
    EXPECT_EQ(trades[2].symbol, "Z");
    EXPECT_EQ(trades[2].side, TradeSide::Buy);
}

TEST_F(RebalancerTest, SimpleTradesForIra) {
    Portfolio ira(2000.0, AccountKind::RothIRA);
    ASSERT_TRUE(ira.buy("A", 10.0, 100.0, makeDate(2024, 1, 2)));

    PriceMap prices{{"A", 100.0}, {"B", 50.0}};
    WeightMap target{{"A", 0.5}, {"B", 0.5}};

    auto rebalancer = makeRebalancer(calendarConfig(CalendarPeriod::Monthly), AccountKind::RothIRA);
    auto trades = rebalancer->generateRebalanceTrades(ira, target, prices);

    // A уже на цели, покупка B на 1000 с буфером
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].symbol, "B");
    EXPECT_EQ(trades[0].side, TradeSide::Buy);
    EXPECT_NEAR(trades[0].quantity, 1000.0 * 0.999 / 50.0, 1e-9);
}

TEST_F(RebalancerTest, CurrentWeightsIncludeCash) {
    Portfolio portfolio(1000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("A", 5.0, 100.0, makeDate(2024, 1, 2)));

    auto weights = Rebalancer::currentWeights(portfolio, {{"A", 100.0}});
    EXPECT_NEAR(weights.at("A"), 0.5, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Перечисления
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RebalancerEnumTest, ParseTypesAndPeriods) {
    EXPECT_EQ(parseRebalanceType("CALENDAR").value(), RebalanceType::Calendar);
    EXPECT_EQ(parseRebalanceType("CASHFLOW_ONLY").value(), RebalanceType::CashflowOnly);
    EXPECT_FALSE(parseRebalanceType("SOMETIMES").has_value());

    EXPECT_EQ(parseCalendarPeriod("Q").value(), CalendarPeriod::Quarterly);
    EXPECT_EQ(parseCalendarPeriod("A").value(), CalendarPeriod::Yearly);
    EXPECT_FALSE(parseCalendarPeriod("X").has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
