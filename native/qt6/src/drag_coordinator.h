#pragma once

#include "destination_resolver.h"
#include "dnd_types.h"
#include "live_announcer.h"
#include "monitor_registry.h"
#include "pointer_normalizer.h"

#include <QHash>
#include <QObject>
#include <QPointer>

#include <functional>
#include <optional>

class QMimeData;
class QWidget;
class DndSettings;
class DraggableBinding;
class DropTargetBinding;

struct DraggableArgs {
    QWidget* element = nullptr;
    // An invalid QVariant means there is nothing to drag right now.
    std::function<QVariant()> getInitialData;
    std::function<void()> onDragStart;
    std::function<void()> onDrop;
};

struct DropTargetArgs {
    QWidget* element = nullptr;
    std::function<bool(const DragSource&)> canDrop;
    std::function<QVariant(const DragSource&, const DragInput&)> getData;
};

struct ActiveDrag {
    DragSource source;
    std::function<void()> sourceOnDrop;
    DragLocation currentLocation;
    DragLocation previousLocation;
};

/**
 * DragCoordinator - owns the sidebar drag session and everything shared by it.
 *
 * One coordinator serves one viewport widget (normally the main window). It holds
 * the single active drag, the monitor registry, the pointer normalizer and the
 * live-region announcer. Rows register through draggable() and
 * dropTargetForElements(); observers through monitorForElements(). Each
 * registration returns a cleanup callable that is safe to call late or twice.
 */
class DragCoordinator : public QObject {
    Q_OBJECT

public:
    explicit DragCoordinator(QWidget* viewport, QObject* parent = nullptr);
    ~DragCoordinator() override;

    QWidget* viewport() const { return m_viewport.data(); }

    DndCleanup draggable(const DraggableArgs& args);
    DndCleanup dropTargetForElements(const DropTargetArgs& args);
    DndCleanup monitorForElements(const MonitorArgs& args);

    QPointF normalizePointerCoordinates(qreal x, qreal y) const;
    std::optional<ResolvedDestination> resolveDestinationFromPointer(qreal x, qreal y) const;

    void announce(const QString& message);
    // Removes the live region; call on shutdown.
    void cleanup();

    void applySettings(const DndSettings& settings);

    bool isDragging() const { return m_active.has_value(); }
    const ActiveDrag* activeDrag() const { return m_active ? &*m_active : nullptr; }

    PointerNormalizer& normalizer() { return m_normalizer; }
    DestinationResolver& resolver() { return m_resolver; }
    LiveAnnouncer& announcer() { return m_announcer; }

    void setVerboseLogging(bool verbose) { m_verbose = verbose; }
    bool verboseLogging() const { return m_verbose; }

signals:
    void dragStarted();
    void dragFinished(bool dropped);

private:
    friend class DraggableBinding;
    friend class DropTargetBinding;

    DragInput readInput(QWidget* element, const QPointF& localPos, Qt::KeyboardModifiers modifiers);
    DragInput lastInput() const;

    bool beginDrag(const DraggableArgs& args, const DragInput& input, QMimeData* mimeData);
    void endDragFrom(QWidget* element, const DragInput& input);

    DragLocation resolveLocation(const DropTargetBinding* binding, const DragInput& input) const;
    const DropTargetBinding* dropTargetAncestor(const QWidget* element) const;

    void updateLocation(const DragLocation& next);
    void finalize(const DragInput& input);
    void releaseElement(QWidget* element);

    void unregisterDropTarget(DropTargetBinding* binding);
    void log(const QString& message) const;

    QPointer<QWidget> m_viewport;
    PointerNormalizer m_normalizer;
    DestinationResolver m_resolver;
    LiveAnnouncer m_announcer;
    MonitorRegistry m_monitors;
    QHash<QWidget*, DropTargetBinding*> m_dropTargets;
    std::optional<ActiveDrag> m_active;
    bool m_verbose = false;
    bool m_finalizing = false;
};
