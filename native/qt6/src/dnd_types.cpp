#include "dnd_types.h"

#include <QRegularExpression>

#include <cmath>
#include <limits>

QString edgeToString(Edge edge)
{
    return edge == Edge::Top ? QStringLiteral("top") : QStringLiteral("bottom");
}

std::optional<Edge> edgeFromString(const QString& value)
{
    if (value == QLatin1String("top")) return Edge::Top;
    if (value == QLatin1String("bottom")) return Edge::Bottom;
    return std::nullopt;
}

DragInput DragInput::fromPoint(const QPointF& p, bool altKey)
{
    DragInput input;
    input.clientX = p.x();
    input.clientY = p.y();
    input.x = p.x();
    input.y = p.y();
    input.altKey = altKey;
    return input;
}

QString targetTypeToString(DestinationData::TargetType type)
{
    switch (type) {
    case DestinationData::TargetType::Document:
        return QStringLiteral("document");
    case DestinationData::TargetType::Folder:
        return QStringLiteral("folder");
    case DestinationData::TargetType::Location:
        break;
    }
    return QStringLiteral("location");
}

QVariantMap DestinationData::toVariantMap() const
{
    QVariantMap m;
    m.insert(DndKeys::LocationId, locationId);
    if (!relPath.isEmpty()) m.insert(DndKeys::RelPath, relPath);
    if (!folderPath.isEmpty()) m.insert(DndKeys::FolderPath, folderPath);
    m.insert(DndKeys::TargetType, targetTypeToString(targetType));
    return m;
}

std::optional<DestinationData> DestinationData::fromVariant(const QVariant& value)
{
    if (!isDroppablePayload(value)) return std::nullopt;
    if (value.typeId() != QMetaType::QVariantMap) return std::nullopt;

    const QVariantMap m = value.toMap();
    const auto locationId = parseLocationId(m.value(DndKeys::LocationId));
    if (!locationId) return std::nullopt;

    DestinationData d;
    d.locationId = *locationId;
    d.relPath = m.value(DndKeys::RelPath).toString();
    d.folderPath = m.value(DndKeys::FolderPath).toString();

    const QString type = m.value(DndKeys::TargetType).toString();
    if (type.isEmpty() || type == QLatin1String("location")) {
        d.targetType = TargetType::Location;
    } else if (type == QLatin1String("document")) {
        d.targetType = TargetType::Document;
    } else if (type == QLatin1String("folder")) {
        d.targetType = TargetType::Folder;
    } else {
        return std::nullopt;
    }
    return d;
}

bool DestinationData::operator==(const DestinationData& other) const
{
    return locationId == other.locationId
        && relPath == other.relPath
        && folderPath == other.folderPath
        && targetType == other.targetType;
}

QString dropTargetKey(const DropTarget& target)
{
    const QVariant& data = target.data;
    if (data.typeId() != QMetaType::QVariantMap) {
        return data.isValid() ? data.toString() : QStringLiteral("undefined");
    }

    const QVariantMap m = data.toMap();
    auto field = [&m](const char* key, const QString& fallback) {
        const QVariant v = m.value(key);
        return (v.isValid() && !v.isNull()) ? v.toString() : fallback;
    };

    return QStringLiteral("%1|%2|%3|%4|%5")
        .arg(field(DndKeys::LocationId, QStringLiteral("none")),
             field(DndKeys::TargetType, QStringLiteral("unknown")),
             field(DndKeys::FolderPath, QString()),
             field(DndKeys::RelPath, QString()),
             field(DndKeys::ClosestEdge, QStringLiteral("none")));
}

bool areDropTargetsEqual(const QList<DropTarget>& left, const QList<DropTarget>& right)
{
    if (left.size() != right.size()) return false;
    for (int i = 0; i < left.size(); ++i) {
        if (dropTargetKey(left.at(i)) != dropTargetKey(right.at(i))) return false;
    }
    return true;
}

bool isDroppablePayload(const QVariant& data)
{
    if (!data.isValid() || data.isNull()) return false;
    if (data.typeId() == QMetaType::QVariantMap) {
        const QVariantMap m = data.toMap();
        if (m.value(DndKeys::TargetType).toString() == QLatin1String("none")) return false;
    }
    return true;
}

std::optional<int> parseLocationId(const QVariant& value)
{
    if (!value.isValid() || value.isNull()) return std::nullopt;

    switch (value.typeId()) {
    case QMetaType::Int:
        return value.toInt();
    case QMetaType::LongLong: {
        const qlonglong v = value.toLongLong();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    case QMetaType::UInt:
    case QMetaType::ULongLong: {
        const qulonglong v = value.toULongLong();
        if (v > static_cast<qulonglong>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(v);
    }
    case QMetaType::Double:
    case QMetaType::Float: {
        const double d = value.toDouble();
        if (!std::isfinite(d)) return std::nullopt;
        if (d < std::numeric_limits<int>::min() || d >= double(std::numeric_limits<int>::max()) + 1.0) return std::nullopt;
        return static_cast<int>(d);
    }
    default:
        break;
    }

    static const QRegularExpression leadingInt(QStringLiteral("^\\s*([+-]?\\d+)"));
    const QRegularExpressionMatch match = leadingInt.match(value.toString());
    if (!match.hasMatch()) return std::nullopt;
    bool ok = false;
    const int id = match.captured(1).toInt(&ok);
    if (!ok) return std::nullopt;
    return id;
}

DndCleanup combineCleanups(const QList<DndCleanup>& cleanups)
{
    return [cleanups]() {
        for (auto it = cleanups.crbegin(); it != cleanups.crend(); ++it) {
            if (*it) (*it)();
        }
    };
}
