#include <gtest/gtest.h>
#include "TaxCalculator.hpp"

using namespace portsim;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class TaxCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        calculator = std::make_unique<TaxCalculator>(TaxConfig{});
    }

    std::unique_ptr<TaxCalculator> calculator;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Ставки по умолчанию
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TaxCalculatorTest, DefaultRates) {
    const auto& config = calculator->getConfig();
    EXPECT_NEAR(config.ordinaryRate(), 0.38, 1e-12);
    EXPECT_NEAR(config.longTermRate(), 0.21, 1e-12);
    EXPECT_NEAR(config.withdrawalTaxRateForIra, 0.25, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сценарии
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TaxCalculatorTest, LongTermGainScenario) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 10.0, 500.0, makeDate(2025, 1, 2)));

    auto summary = calculator->calculateAnnualTax(2025, portfolio);

    EXPECT_EQ(summary.year, 2025);
    EXPECT_NEAR(summary.longTermGains, 1000.0, 1e-9);
    EXPECT_NEAR(summary.longTermTax, 210.0, 1e-9);
    EXPECT_NEAR(summary.totalTax, 210.0, 1e-9);
}

TEST_F(TaxCalculatorTest, ShortTermGainScenario) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 10.0, 500.0, makeDate(2024, 6, 1)));

    auto summary = calculator->calculateAnnualTax(2024, portfolio);

    EXPECT_NEAR(summary.shortTermGains, 1000.0, 1e-9);
    EXPECT_NEAR(summary.shortTermTax, 380.0, 1e-9);
    EXPECT_NEAR(summary.totalTax, 380.0, 1e-9);
}

TEST_F(TaxCalculatorTest, RothIsNeverTaxed) {
    Portfolio roth(100000.0, AccountKind::RothIRA);
    ASSERT_TRUE(roth.buy("SPY", 100.0, 400.0, makeDate(2024, 1, 2)));
    EXPECT_DOUBLE_EQ(roth.cash(), 60000.0);

    ASSERT_TRUE(roth.sell("SPY", 50.0, 500.0, makeDate(2024, 6, 3)));
    roth.recordDividend("SPY", 300.0, makeDate(2024, 9, 20), 0.9);
    double cashBefore = roth.cash();

    double tax = calculator->applyYearEndTax(2024, roth, false);

    EXPECT_DOUBLE_EQ(tax, 0.0);
    EXPECT_DOUBLE_EQ(roth.cash(), cashBefore);
    EXPECT_DOUBLE_EQ(calculator->calculateAnnualTax(2024, roth).totalTax, 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Компоненты налога
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TaxCalculatorTest, LossesProduceNoNegativeTax) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 500.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(portfolio.sell("SPY", 10.0, 400.0, makeDate(2024, 6, 3)));

    auto summary = calculator->calculateAnnualTax(2024, portfolio);

    EXPECT_NEAR(summary.shortTermGains, -1000.0, 1e-9);
    EXPECT_DOUBLE_EQ(summary.shortTermTax, 0.0);
    EXPECT_DOUBLE_EQ(summary.totalTax, 0.0);
}

TEST_F(TaxCalculatorTest, DividendsAndInterest) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    portfolio.recordDividend("SPY", 1000.0, makeDate(2024, 3, 15), 0.8);
    portfolio.recordInterest(100.0, makeDate(2024, 12, 31));

    auto summary = calculator->calculateAnnualTax(2024, portfolio);

    EXPECT_NEAR(summary.qualifiedDividendTax, 800.0 * 0.21, 1e-9);
    EXPECT_NEAR(summary.ordinaryDividendTax, 200.0 * 0.38, 1e-9);
    EXPECT_NEAR(summary.interestTax, 100.0 * 0.38, 1e-9);
    EXPECT_NEAR(summary.totalTax, 168.0 + 76.0 + 38.0, 1e-9);
}

TEST_F(TaxCalculatorTest, IdempotentForSameYear) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(portfolio.sell("SPY", 5.0, 450.0, makeDate(2024, 7, 1)));
    portfolio.recordDividend("SPY", 40.0, makeDate(2024, 9, 20), 0.5);

    auto first = calculator->calculateAnnualTax(2024, portfolio);
    auto second = calculator->calculateAnnualTax(2024, portfolio);

    EXPECT_DOUBLE_EQ(first.shortTermGains, second.shortTermGains);
    EXPECT_DOUBLE_EQ(first.qualifiedDividends, second.qualifiedDividends);
    EXPECT_DOUBLE_EQ(first.totalTax, second.totalTax);
    EXPECT_EQ(first.washSaleCount, second.washSaleCount);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Годовое списание
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TaxCalculatorTest, YearEndTaxDeductsCash) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 10.0, 500.0, makeDate(2024, 6, 1)));
    double cashBefore = portfolio.cash();

    double tax = calculator->applyYearEndTax(2024, portfolio, false);

    EXPECT_NEAR(tax, 380.0, 1e-9);
    EXPECT_NEAR(portfolio.cash(), cashBefore - 380.0, 1e-9);
}

TEST_F(TaxCalculatorTest, ExternalPaymentLeavesCash) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 10.0, 500.0, makeDate(2024, 6, 1)));
    double cashBefore = portfolio.cash();

    double tax = calculator->applyYearEndTax(2024, portfolio, true);

    EXPECT_NEAR(tax, 380.0, 1e-9);
    EXPECT_DOUBLE_EQ(portfolio.cash(), cashBefore);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Стоимость после налогов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TaxCalculatorTest, AfterTaxValueByAccountType) {
    PriceMap prices{{"SPY", 500.0}, {"AGG", 90.0}};

    Portfolio taxable(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(taxable.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 2)));
    ASSERT_TRUE(taxable.buy("AGG", 10.0, 100.0, makeDate(2024, 1, 2)));
    // 5000 наличных + 5000 SPY + 900 AGG; налог только с прибыли SPY
    EXPECT_NEAR(calculator->calculateAfterTaxValue(taxable, prices),
                10900.0 - 1000.0 * 0.21, 1e-9);

    Portfolio ira(10000.0, AccountKind::TraditionalIRA);
    ASSERT_TRUE(ira.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 2)));
    EXPECT_NEAR(calculator->calculateAfterTaxValue(ira, prices), 11000.0 * 0.75, 1e-9);

    Portfolio roth(10000.0, AccountKind::RothIRA);
    ASSERT_TRUE(roth.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 2)));
    EXPECT_NEAR(calculator->calculateAfterTaxValue(roth, prices), 11000.0, 1e-9);
}

TEST_F(TaxCalculatorTest, TaxDragPerYear) {
    Portfolio portfolio(10000.0, AccountKind::Taxable);
    ASSERT_TRUE(portfolio.buy("SPY", 10.0, 400.0, makeDate(2024, 1, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 5.0, 500.0, makeDate(2024, 6, 1)));
    ASSERT_TRUE(portfolio.sell("SPY", 5.0, 500.0, makeDate(2025, 3, 3)));

    auto drag = calculator->calculateTaxDrag(portfolio, {2024, 2025, 2026});

    EXPECT_NEAR(drag.at(2024), 500.0 * 0.38, 1e-9);
    EXPECT_NEAR(drag.at(2025), 500.0 * 0.21, 1e-9);
    EXPECT_DOUBLE_EQ(drag.at(2026), 0.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
