#pragma once

#include "dnd_types.h"

#include <QPointF>
#include <QPointer>
#include <QRectF>

#include <optional>

class QWidget;

struct ResolvedDestination {
    DestinationData destination;
    QPointer<QWidget> element;
};

/**
 * DestinationResolver - finds the logical drop destination under a viewport point.
 *
 * Resolution order:
 *  1. The widget under the point and its nearest ancestor carrying a locationId.
 *  2. Every scan candidate (see DndAttributes) whose rectangle contains the point,
 *     ranked by priority (document > folder > location), then smaller area, then
 *     traversal order.
 *  3. The vertically nearest candidate spanning the point's x, within
 *     NearestRowThreshold, reported as a bare location.
 */
class DestinationResolver
{
public:
    static constexpr qreal NearestRowThreshold = 64.0;

    explicit DestinationResolver(QWidget* root = nullptr);

    void setRoot(QWidget* root) { m_root = root; }
    QWidget* root() const { return m_root.data(); }

    std::optional<ResolvedDestination> resolve(const QPointF& point) const;

    static std::optional<DestinationData> destinationFromWidget(const QWidget* widget);
    static int priority(const DestinationData& destination);

private:
    struct Candidate {
        DestinationData destination;
        QWidget* element = nullptr;
        QRectF rect;
        int priority = 0;
        qreal area = 0;
        int order = 0;
    };

    // True when a ranks strictly ahead of b.
    static bool ranksBefore(const Candidate& a, const Candidate& b);

    std::optional<ResolvedDestination> resolveUnderPoint(const QPointF& point) const;
    QList<Candidate> scanCandidates() const;
    bool isExplicitlyHidden(const QWidget* widget) const;

    QPointer<QWidget> m_root;
};
