#pragma once

#include <QList>
#include <QPointF>
#include <QPointer>
#include <QString>
#include <QVariant>
#include <QWidget>

#include <functional>
#include <optional>

/**
 * Shared value types of the sidebar drag-and-drop engine.
 *
 * Payloads are opaque QVariants. Destination payloads are QVariantMaps using the
 * DndKeys names below, so they can be produced by row widgets without linking
 * against anything but Qt.
 */
namespace DndKeys {
inline constexpr char InternalMime[] = "application/x-writer-sidebar-dnd";
inline constexpr char PlainTextMarker[] = "writer-sidebar-drag";

inline constexpr char LocationId[] = "locationId";
inline constexpr char RelPath[] = "relPath";
inline constexpr char FolderPath[] = "folderPath";
inline constexpr char TargetType[] = "targetType";
inline constexpr char ClosestEdge[] = "closestEdge";
inline constexpr char Type[] = "type";
} // namespace DndKeys

enum class Edge { Top, Bottom };

QString edgeToString(Edge edge);
std::optional<Edge> edgeFromString(const QString& value);

// Pointer snapshot, always in the coordinator's viewport coordinate space.
struct DragInput {
    qreal clientX = 0;
    qreal clientY = 0;
    qreal x = 0;
    qreal y = 0;
    bool altKey = false;

    QPointF point() const { return QPointF(clientX, clientY); }
    static DragInput fromPoint(const QPointF& p, bool altKey = false);
};

struct DragSource {
    QVariant data;
    QPointer<QWidget> element;
};

struct DropTarget {
    QPointer<QWidget> element;
    QVariant data;
};

struct DragLocation {
    QList<DropTarget> dropTargets;
    DragInput input;

    bool isEmpty() const { return dropTargets.isEmpty(); }
    static DragLocation empty(const DragInput& input) { return DragLocation{ {}, input }; }
};

struct DragLocationHistory {
    DragLocation current;
    DragLocation previous;
};

struct DestinationData {
    enum class TargetType { Location, Document, Folder };

    int locationId = 0;
    QString relPath;
    QString folderPath;
    TargetType targetType = TargetType::Location;

    QVariantMap toVariantMap() const;

    // Null, non-map, "none" typed or id-less payloads are not destinations.
    static std::optional<DestinationData> fromVariant(const QVariant& value);

    bool operator==(const DestinationData& other) const;
    bool operator!=(const DestinationData& other) const { return !(*this == other); }
};

QString targetTypeToString(DestinationData::TargetType type);

// Key used to decide whether two locations name the same logical target.
QString dropTargetKey(const DropTarget& target);
bool areDropTargetsEqual(const QList<DropTarget>& left, const QList<DropTarget>& right);

// Payload with targetType "none" (or no payload at all) means "cannot drop here".
bool isDroppablePayload(const QVariant& data);

// Lenient integer parse: "12", " 12px" -> 12; "", "abc" -> nullopt.
std::optional<int> parseLocationId(const QVariant& value);

using DndCleanup = std::function<void()>;

// Runs every cleanup in reverse registration order.
DndCleanup combineCleanups(const QList<DndCleanup>& cleanups);
