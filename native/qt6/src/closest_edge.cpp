#include "closest_edge.h"

#include "dnd_attributes.h"

#include <QWidget>

namespace ClosestEdge {

QVariant attach(const QVariant& data, const Options& options)
{
    if (options.allowedEdges.isEmpty() || !options.element) return data;
    if (data.typeId() != QMetaType::QVariantMap) return data;

    const QWidget* viewport = options.viewport ? options.viewport : options.element->window();
    const QRectF rect = DndAttributes::boundingRect(options.element, viewport);
    const qreal midpoint = rect.top() + rect.height() / 2.0;
    const Edge edge = options.input.clientY <= midpoint ? Edge::Top : Edge::Bottom;
    if (!options.allowedEdges.contains(edge)) return data;

    QVariantMap m = data.toMap();
    m.insert(DndKeys::ClosestEdge, edgeToString(edge));
    return m;
}

std::optional<Edge> extract(const QVariant& value)
{
    if (value.typeId() != QMetaType::QVariantMap) return std::nullopt;
    const QVariant edge = value.toMap().value(DndKeys::ClosestEdge);
    if (edge.typeId() != QMetaType::QString) return std::nullopt;
    return edgeFromString(edge.toString());
}

} // namespace ClosestEdge
