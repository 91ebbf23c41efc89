// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/PathfinderConfig.hpp"

#include "routing/Region.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace Qt::StringLiterals;

namespace Routing {

namespace {

const QString kStepCostKey = u"stepCost"_s;
const QString kTurnPenaltyRatioKey = u"turnPenaltyRatio"_s;
const QString kMaxExploredNodesKey = u"maxExploredNodes"_s;
const QString kSearchBoundsKey = u"searchBounds"_s;

bool fail(QString* error, const QString& message)
{
    if (error)
        *error = message;
    qCWarning(routinglog) << "PathfinderConfig:" << message;
    return false;
}

bool readPositiveInt(const QJsonObject& object, const QString& key, int maxValue, int* out, QString* error)
{
    if (!object.contains(key))
        return true;

    const QJsonValue value = object.value(key);
    const double d = value.toDouble(-1.0);
    if (!value.isDouble() || std::trunc(d) != d || d < 1.0)
        return fail(error, QStringLiteral("'%1' must be a positive integer.").arg(key));
    if (d > static_cast<double>(maxValue))
        return fail(error, QStringLiteral("'%1' must not exceed %2.").arg(key).arg(maxValue));

    *out = static_cast<int>(d);
    return true;
}

} // namespace

int PathfinderConfig::defaultTurnPenalty() const
{
    const double penalty = turnPenaltyRatio * static_cast<double>(stepCost);
    if (!(penalty > 0.0))
        return 0;
    return static_cast<int>(std::lround(std::min(penalty, static_cast<double>(kMaxTurnPenalty))));
}

QJsonObject PathfinderConfig::toJson() const
{
    QJsonObject o;
    o.insert(kStepCostKey, stepCost);
    o.insert(kTurnPenaltyRatioKey, turnPenaltyRatio);
    o.insert(kMaxExploredNodesKey, maxExploredNodes);
    if (isBounded())
        o.insert(kSearchBoundsKey, Region::fromRect(searchBounds).toJson());
    return o;
}

std::optional<PathfinderConfig> PathfinderConfig::fromJson(const QJsonObject& object, QString* error)
{
    PathfinderConfig cfg;

    if (!readPositiveInt(object, kStepCostKey, kMaxStepCost, &cfg.stepCost, error))
        return std::nullopt;
    if (!readPositiveInt(object, kMaxExploredNodesKey, std::numeric_limits<int>::max(),
                         &cfg.maxExploredNodes, error))
        return std::nullopt;

    if (object.contains(kTurnPenaltyRatioKey)) {
        const QJsonValue value = object.value(kTurnPenaltyRatioKey);
        if (!value.isDouble() || value.toDouble() < 0.0) {
            fail(error, QStringLiteral("'%1' must be a non-negative number.").arg(kTurnPenaltyRatioKey));
            return std::nullopt;
        }
        cfg.turnPenaltyRatio = value.toDouble();
    }

    if (cfg.turnPenaltyRatio * cfg.stepCost > static_cast<double>(kMaxTurnPenalty)) {
        fail(error, QStringLiteral("'%1' times '%2' must not exceed %3.")
                        .arg(kTurnPenaltyRatioKey, kStepCostKey)
                        .arg(kMaxTurnPenalty));
        return std::nullopt;
    }

    if (object.contains(kSearchBoundsKey)) {
        const QJsonValue value = object.value(kSearchBoundsKey);
        if (!value.isObject()) {
            fail(error, QStringLiteral("'%1' must be a region object.").arg(kSearchBoundsKey));
            return std::nullopt;
        }

        QString regionError;
        const auto bounds = Region::fromJson(value.toObject(), &regionError);
        if (!bounds || !bounds->isValid()) {
            fail(error, QStringLiteral("'%1' is not a valid region. %2").arg(kSearchBoundsKey, regionError));
            return std::nullopt;
        }
        cfg.searchBounds = bounds->toRect();
    }

    if (error)
        error->clear();
    return cfg;
}

std::optional<PathfinderConfig> PathfinderConfig::loadFromFile(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        fail(error, QStringLiteral("Config path is empty."));
        return std::nullopt;
    }

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        fail(error, QStringLiteral("Failed to open config file: %1 (%2)").arg(cleanedPath, file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        fail(error, QStringLiteral("Failed to parse config file: %1 (%2)")
                        .arg(cleanedPath, parseError.errorString()));
        return std::nullopt;
    }

    if (!doc.isObject()) {
        fail(error, QStringLiteral("Config document is not an object: %1").arg(cleanedPath));
        return std::nullopt;
    }

    return fromJson(doc.object(), error);
}

} // namespace Routing
