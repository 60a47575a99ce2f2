#pragma once

#include "drag_coordinator.h"

#include <QObject>
#include <QPoint>
#include <QPointer>
#include <QVariant>

class QDragEnterEvent;
class QDragLeaveEvent;
class QDragMoveEvent;
class QDropEvent;
class QMouseEvent;
class DragGestureEvent;

// Event filter turning a widget into a drag source of a DragCoordinator.
class DraggableBinding : public QObject {
    Q_OBJECT

public:
    DraggableBinding(DragCoordinator* coordinator, const DraggableArgs& args);
    ~DraggableBinding() override;

    QWidget* element() const { return m_element.data(); }

    // Restores the element and drops the session it owns.
    void detach();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void handleGesture(DragGestureEvent* event);
    void runDrag(const QPointF& localPos, Qt::KeyboardModifiers modifiers);

    QPointer<DragCoordinator> m_coordinator;
    QPointer<QWidget> m_element;
    DraggableArgs m_args;
    QPoint m_pressPos;
    bool m_pressed = false;
    bool m_detached = false;
};

// Event filter turning a widget into a candidate destination.
class DropTargetBinding : public QObject {
    Q_OBJECT

public:
    DropTargetBinding(DragCoordinator* coordinator, const DropTargetArgs& args);
    ~DropTargetBinding() override;

    QWidget* element() const { return m_element.data(); }

    // Location this target alone would produce for the active session.
    DragLocation resolveOwnLocation(const DragInput& input) const;

    void detach();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void handleDragEnter(QDragEnterEvent* event);
    void handleDragMove(QDragMoveEvent* event);
    void handleDragLeave(QDragLeaveEvent* event);
    void handleDrop(QDropEvent* event);

    QPointer<DragCoordinator> m_coordinator;
    QPointer<QWidget> m_element;
    DropTargetArgs m_args;
    bool m_previousAcceptDrops = false;
    bool m_detached = false;
};
