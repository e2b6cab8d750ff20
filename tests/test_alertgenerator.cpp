/**
 * @file test_alertgenerator.cpp
 * @brief Unit tests for record and trend alert rules
 */

#include <gtest/gtest.h>
#include "analytics/alertgenerator.h"

namespace {

ExtractionRecord recordWith(double temperature, double pressure)
{
    ExtractionRecord record;
    record.id = 7;
    record.parameters.temperature = temperature;
    record.parameters.pressure = pressure;
    record.createdAt = QDateTime::currentDateTimeUtc();
    return record;
}

} // namespace

TEST(AlertGeneratorTest, IdealRecordRaisesNothing) {
    AlertGenerator generator;
    EXPECT_TRUE(generator.forRecord(recordWith(93, 9), QDateTime::currentDateTimeUtc()).isEmpty());
    EXPECT_TRUE(generator.forRecord(recordWith(96, 10), QDateTime::currentDateTimeUtc()).isEmpty());
}

TEST(AlertGeneratorTest, HotWaterIsCritical) {
    AlertGenerator generator;
    QDateTime now = QDateTime::currentDateTimeUtc();
    QList<Alert> alerts = generator.forRecord(recordWith(98, 9), now);

    ASSERT_EQ(alerts.size(), 1);
    const Alert& alert = alerts.first();
    EXPECT_EQ(alert.rule, "Temperature Deviation");
    EXPECT_EQ(alert.severity, AlertSeverity::Critical);
    EXPECT_EQ(alert.category, AlertCategory::ParameterDeviation);
    EXPECT_EQ(alert.timestamp, now);
    EXPECT_FALSE(alert.id.isEmpty());
    EXPECT_FALSE(alert.id.startsWith('{'));
    EXPECT_EQ(alert.metadata["recordId"].toInteger(), 7);
    EXPECT_DOUBLE_EQ(alert.metadata["temperature"].toDouble(), 98.0);
}

TEST(AlertGeneratorTest, PressureOutsideWindowIsWarning) {
    AlertGenerator generator;
    QList<Alert> alerts = generator.forRecord(recordWith(93, 7), QDateTime::currentDateTimeUtc());

    ASSERT_EQ(alerts.size(), 1);
    EXPECT_EQ(alerts.first().rule, "Pressure Instability");
    EXPECT_EQ(alerts.first().severity, AlertSeverity::Warning);
}

TEST(AlertGeneratorTest, BothDeviationsRaiseTwoAlerts) {
    AlertGenerator generator;
    QList<Alert> alerts = generator.forRecord(recordWith(86, 11.5), QDateTime::currentDateTimeUtc());

    ASSERT_EQ(alerts.size(), 2);
    EXPECT_NE(alerts[0].id, alerts[1].id);
}

TEST(AlertGeneratorTest, LowPerfectRateRaisesTrendAlert) {
    AlertGenerator generator;
    ExtractionTrends trends;
    trends.period = TrendPeriod::Weekly;
    trends.sampleCount = 10;
    trends.perfectExtractionRate = 30.0;

    QList<Alert> alerts = generator.forTrends(trends, QDateTime::currentDateTimeUtc());
    ASSERT_EQ(alerts.size(), 1);
    EXPECT_EQ(alerts.first().rule, "Low Perfect Extraction Rate");
    EXPECT_EQ(alerts.first().category, AlertCategory::ExtractionQuality);
    EXPECT_EQ(alerts.first().metadata["period"].toString(), "weekly");
}

TEST(AlertGeneratorTest, TrendRuleNeedsSamples) {
    AlertGenerator generator;
    ExtractionTrends empty;
    EXPECT_TRUE(generator.forTrends(empty, QDateTime::currentDateTimeUtc()).isEmpty());

    ExtractionTrends healthy;
    healthy.sampleCount = 4;
    healthy.perfectExtractionRate = 75.0;
    EXPECT_TRUE(generator.forTrends(healthy, QDateTime::currentDateTimeUtc()).isEmpty());
}

TEST(AlertGeneratorTest, AlertJsonUsesNames) {
    AlertGenerator generator;
    QList<Alert> alerts = generator.forRecord(recordWith(99, 9), QDateTime::currentDateTimeUtc());
    ASSERT_EQ(alerts.size(), 1);

    QJsonObject json = alerts.first().toJson();
    EXPECT_EQ(json["severity"].toString(), "Critical");
    EXPECT_EQ(json["category"].toString(), "ParameterDeviation");
    EXPECT_EQ(json["rule"].toString(), "Temperature Deviation");
    EXPECT_TRUE(json["metadata"].isObject());
}

TEST(AlertGeneratorTest, RuleNamesListed) {
    AlertGenerator generator;
    QStringList names = generator.ruleNames();
    EXPECT_EQ(names.size(), 3);
    EXPECT_TRUE(names.contains("Pressure Instability"));
}
