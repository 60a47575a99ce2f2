#include "drop_policy.h"

#include "dnd_types.h"

#include <QVariantMap>

namespace {

struct Payload {
    QString type;
    std::optional<int> locationId;
    QString relPath;
};

std::optional<Payload> readPayload(const QVariant& value)
{
    if (value.typeId() != QMetaType::QVariantMap) return std::nullopt;
    const QVariantMap m = value.toMap();
    Payload p;
    p.type = m.value(DndKeys::Type).toString();
    p.locationId = parseLocationId(m.value(DndKeys::LocationId));
    p.relPath = m.value(DndKeys::RelPath).toString();
    return p;
}

QString trimSlashes(QString path)
{
    while (path.startsWith(QLatin1Char('/'))) path.remove(0, 1);
    while (path.endsWith(QLatin1Char('/'))) path.chop(1);
    return path;
}

} // namespace

namespace DropPolicy {

QString parentFolderOf(const QString& relPath)
{
    const QString path = trimSlashes(relPath);
    const int slash = path.lastIndexOf(QLatin1Char('/'));
    return slash < 0 ? QString() : path.left(slash);
}

bool canDropDocumentIntoFolder(const QVariant& dragPayload, int targetLocationId, const QString& targetFolderPath)
{
    const auto payload = readPayload(dragPayload);
    if (!payload || payload->type != QLatin1String("document") || !payload->locationId) return false;

    if (*payload->locationId != targetLocationId) return true;

    return parentFolderOf(payload->relPath) != trimSlashes(targetFolderPath);
}

bool canDropFolderIntoFolder(const QVariant& dragPayload, int targetLocationId, const QString& targetFolderPath)
{
    const auto payload = readPayload(dragPayload);
    if (!payload || payload->type != QLatin1String("folder") || !payload->locationId) return false;

    if (*payload->locationId != targetLocationId) return true;

    const QString source = trimSlashes(payload->relPath);
    const QString target = trimSlashes(targetFolderPath);
    if (source == target) return false;
    if (target.startsWith(source + QLatin1Char('/'))) return false;
    return true;
}

bool canReorderDocument(const QVariant& dragPayload, int targetLocationId, const QString& targetRelPath)
{
    const auto payload = readPayload(dragPayload);
    if (!payload || payload->type != QLatin1String("document") || !payload->locationId) return false;
    return *payload->locationId == targetLocationId && payload->relPath != targetRelPath;
}

} // namespace DropPolicy
