#include "destination_resolver.h"

#include "dnd_attributes.h"

#include <QWidget>

#include <algorithm>
#include <limits>

namespace {

bool rectContains(const QRectF& r, const QPointF& p)
{
    return p.x() >= r.left() && p.x() <= r.right() && p.y() >= r.top() && p.y() <= r.bottom();
}

} // namespace

DestinationResolver::DestinationResolver(QWidget* root)
    : m_root(root)
{
}

std::optional<DestinationData> DestinationResolver::destinationFromWidget(const QWidget* widget)
{
    if (!widget) return std::nullopt;
    const auto locationId = parseLocationId(widget->property(DndAttributes::LocationId));
    if (!locationId) return std::nullopt;

    DestinationData d;
    d.locationId = *locationId;

    const QString documentPath = widget->property(DndAttributes::DocumentPath).toString();
    if (!documentPath.isEmpty()) {
        d.relPath = documentPath;
        d.targetType = DestinationData::TargetType::Document;
        return d;
    }

    const QString folderPath = widget->property(DndAttributes::FolderPath).toString();
    if (!folderPath.isEmpty()) {
        d.folderPath = folderPath;
        d.targetType = DestinationData::TargetType::Folder;
        return d;
    }

    d.targetType = DestinationData::TargetType::Location;
    return d;
}

int DestinationResolver::priority(const DestinationData& destination)
{
    if (destination.targetType == DestinationData::TargetType::Document) return 3;
    if (destination.targetType == DestinationData::TargetType::Folder || !destination.folderPath.isEmpty()) return 2;
    return 1;
}

bool DestinationResolver::ranksBefore(const Candidate& a, const Candidate& b)
{
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.area != b.area) return a.area < b.area;
    return a.order < b.order;
}

bool DestinationResolver::isExplicitlyHidden(const QWidget* widget) const
{
    for (const QWidget* w = widget; w; w = w->parentWidget()) {
        if (w->testAttribute(Qt::WA_WState_ExplicitShowHide) && w->testAttribute(Qt::WA_WState_Hidden)) {
            return true;
        }
        if (w == m_root) break;
    }
    return false;
}

std::optional<ResolvedDestination> DestinationResolver::resolveUnderPoint(const QPointF& point) const
{
    QWidget* hit = m_root->childAt(point.toPoint());
    if (!hit && rectContains(QRectF(QPointF(0, 0), QSizeF(m_root->size())), point)) hit = m_root;

    for (QWidget* w = hit; w; w = (w == m_root ? nullptr : w->parentWidget())) {
        if (!DndAttributes::hasLocationId(w)) continue;
        // Nearest carrier decides; an unparseable one falls through to the scan.
        if (auto destination = destinationFromWidget(w)) {
            return ResolvedDestination{ *destination, w };
        }
        return std::nullopt;
    }
    return std::nullopt;
}

QList<DestinationResolver::Candidate> DestinationResolver::scanCandidates() const
{
    QList<QWidget*> widgets;
    widgets << m_root.data();
    widgets << m_root->findChildren<QWidget*>();

    QList<Candidate> out;
    int order = 0;
    for (QWidget* w : widgets) {
        if (!DndAttributes::isScanCandidate(w) || isExplicitlyHidden(w)) continue;
        const auto destination = destinationFromWidget(w);
        if (!destination) continue;

        Candidate c;
        c.destination = *destination;
        c.element = w;
        c.rect = DndAttributes::boundingRect(w, m_root);
        c.priority = priority(*destination);
        c.area = std::max<qreal>(1.0, c.rect.width() * c.rect.height());
        c.order = order++;
        out << c;
    }
    return out;
}

std::optional<ResolvedDestination> DestinationResolver::resolve(const QPointF& point) const
{
    if (!m_root) return std::nullopt;

    if (auto direct = resolveUnderPoint(point)) return direct;

    const QList<Candidate> candidates = scanCandidates();

    QList<Candidate> containing;
    for (const Candidate& c : candidates) {
        if (rectContains(c.rect, point)) containing << c;
    }
    if (!containing.isEmpty()) {
        const auto best = std::min_element(containing.cbegin(), containing.cend(), &DestinationResolver::ranksBefore);
        return ResolvedDestination{ best->destination, best->element };
    }

    qreal nearestDistance = std::numeric_limits<qreal>::infinity();
    const Candidate* nearest = nullptr;
    for (const Candidate& c : candidates) {
        if (point.x() < c.rect.left() || point.x() > c.rect.right()) continue;
        qreal distance = 0;
        if (point.y() < c.rect.top()) distance = c.rect.top() - point.y();
        else if (point.y() > c.rect.bottom()) distance = point.y() - c.rect.bottom();
        if (distance < nearestDistance) {
            nearestDistance = distance;
            nearest = &c;
        }
    }

    if (!nearest || nearestDistance >= NearestRowThreshold) return std::nullopt;

    DestinationData location;
    location.locationId = nearest->destination.locationId;
    location.targetType = DestinationData::TargetType::Location;
    return ResolvedDestination{ location, nearest->element };
}
