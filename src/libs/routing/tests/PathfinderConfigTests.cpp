// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "routing/PathfinderConfig.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QTemporaryDir>

using Routing::PathfinderConfig;

namespace {

bool writeFile(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(bytes) == bytes.size();
}

} // namespace

TEST(PathfinderConfigTests, Defaults)
{
    const PathfinderConfig cfg;
    EXPECT_EQ(cfg.stepCost, 1);
    EXPECT_DOUBLE_EQ(cfg.turnPenaltyRatio, 2.0);
    EXPECT_EQ(cfg.defaultTurnPenalty(), 2);
    EXPECT_FALSE(cfg.isBounded());
    EXPECT_GT(cfg.maxExploredNodes, 0);
}

TEST(PathfinderConfigTests, ReadsAllKeys)
{
    const QJsonObject o{
        {"stepCost", 15},
        {"turnPenaltyRatio", 1.5},
        {"maxExploredNodes", 500},
        {"searchBounds", QJsonObject{{"x", -2}, {"y", 0}, {"dx", 40}, {"dy", 30}}},
    };

    QString error;
    const auto cfg = PathfinderConfig::fromJson(o, &error);
    ASSERT_TRUE(cfg.has_value()) << error.toStdString();
    EXPECT_EQ(cfg->stepCost, 15);
    EXPECT_EQ(cfg->maxExploredNodes, 500);
    EXPECT_EQ(cfg->defaultTurnPenalty(), 23);
    EXPECT_EQ(cfg->searchBounds, QRect(-2, 0, 40, 30));
    EXPECT_TRUE(error.isEmpty());
}

TEST(PathfinderConfigTests, MissingKeysKeepDefaults)
{
    const auto cfg = PathfinderConfig::fromJson(QJsonObject{{"maxExploredNodes", 10}});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->stepCost, PathfinderConfig::kDefaultStepCost);
    EXPECT_EQ(cfg->maxExploredNodes, 10);
    EXPECT_FALSE(cfg->isBounded());
}

TEST(PathfinderConfigTests, RejectsBadValues)
{
    QString error;
    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"stepCost", 0}}, &error).has_value());
    EXPECT_TRUE(error.contains("stepCost"));

    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"stepCost", 2.5}}, &error).has_value());
    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"maxExploredNodes", "many"}}, &error).has_value());
    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"turnPenaltyRatio", -1.0}}, &error).has_value());
    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"searchBounds", 3}}, &error).has_value());
    EXPECT_FALSE(PathfinderConfig::fromJson(
                     QJsonObject{{"searchBounds", QJsonObject{{"x", 0}, {"y", 0}, {"dx", 0}}}}, &error)
                     .has_value());
}

TEST(PathfinderConfigTests, RejectsCostsThatCouldOverflow)
{
    QString error;
    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"stepCost", 2000000000}}, &error).has_value());
    EXPECT_TRUE(error.contains("stepCost"));

    EXPECT_FALSE(PathfinderConfig::fromJson(QJsonObject{{"maxExploredNodes", 1e20}}, &error).has_value());
    EXPECT_TRUE(error.contains("maxExploredNodes"));

    EXPECT_FALSE(PathfinderConfig::fromJson(
                     QJsonObject{{"stepCost", PathfinderConfig::kMaxStepCost}, {"turnPenaltyRatio", 1000.0}}, &error)
                     .has_value());
    EXPECT_TRUE(error.contains("turnPenaltyRatio"));

    const auto largest = PathfinderConfig::fromJson(
        QJsonObject{{"stepCost", PathfinderConfig::kMaxStepCost}, {"turnPenaltyRatio", 100.0}}, &error);
    ASSERT_TRUE(largest.has_value()) << error.toStdString();
    EXPECT_EQ(largest->defaultTurnPenalty(), PathfinderConfig::kMaxTurnPenalty);
}

TEST(PathfinderConfigTests, DefaultTurnPenaltyIsClamped)
{
    PathfinderConfig cfg;
    cfg.stepCost = 2000000000;
    cfg.turnPenaltyRatio = 4.0;
    EXPECT_EQ(cfg.defaultTurnPenalty(), PathfinderConfig::kMaxTurnPenalty);

    cfg.turnPenaltyRatio = -1.0;
    EXPECT_EQ(cfg.defaultTurnPenalty(), 0);
}

TEST(PathfinderConfigTests, JsonRoundTripKeepsBounds)
{
    PathfinderConfig cfg;
    cfg.stepCost = 8;
    cfg.turnPenaltyRatio = 3.0;
    cfg.searchBounds = QRect(1, 2, 30, 20);

    const auto back = PathfinderConfig::fromJson(cfg.toJson());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->stepCost, 8);
    EXPECT_EQ(back->defaultTurnPenalty(), 24);
    EXPECT_EQ(back->searchBounds, cfg.searchBounds);
}

TEST(PathfinderConfigTests, LoadsFromFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString path = QDir(dir.path()).filePath("routing.json");
    ASSERT_TRUE(writeFile(path, R"({"stepCost": 4, "searchBounds": {"x": 0, "y": 0, "dx": 10, "dy": 10}})"));

    QString error;
    const auto cfg = PathfinderConfig::loadFromFile(path, &error);
    ASSERT_TRUE(cfg.has_value()) << error.toStdString();
    EXPECT_EQ(cfg->stepCost, 4);
    EXPECT_EQ(cfg->defaultTurnPenalty(), 8);
    EXPECT_EQ(cfg->searchBounds, QRect(0, 0, 10, 10));
}

TEST(PathfinderConfigTests, LoadReportsFileErrors)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString error;
    EXPECT_FALSE(PathfinderConfig::loadFromFile(QString(), &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(PathfinderConfig::loadFromFile(QDir(dir.path()).filePath("missing.json"), &error).has_value());
    EXPECT_TRUE(error.startsWith("Failed to open"));

    const QString broken = QDir(dir.path()).filePath("broken.json");
    ASSERT_TRUE(writeFile(broken, "{ not json"));
    EXPECT_FALSE(PathfinderConfig::loadFromFile(broken, &error).has_value());
    EXPECT_TRUE(error.startsWith("Failed to parse"));

    const QString array = QDir(dir.path()).filePath("array.json");
    ASSERT_TRUE(writeFile(array, "[1, 2]"));
    EXPECT_FALSE(PathfinderConfig::loadFromFile(array, &error).has_value());
    EXPECT_TRUE(error.contains("not an object"));
}
