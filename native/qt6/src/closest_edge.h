#pragma once

#include "dnd_types.h"

#include <QList>
#include <QVariant>

#include <optional>

class QWidget;

namespace ClosestEdge {

struct Options {
    DragInput input;
    const QWidget* element = nullptr;
    QList<Edge> allowedEdges;
    // Coordinate space of input; defaults to element's top-level window.
    const QWidget* viewport = nullptr;
};

// Returns data with the closest edge stored under DndKeys::ClosestEdge, or data
// unchanged when no edge is allowed, the edge is not allowed or data is not a map.
QVariant attach(const QVariant& data, const Options& options);

std::optional<Edge> extract(const QVariant& value);

} // namespace ClosestEdge
