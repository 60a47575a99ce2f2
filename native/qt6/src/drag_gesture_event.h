#pragma once

#include <QEvent>
#include <QPointF>
#include <Qt>

class QMimeData;

/**
 * DragGestureEvent - drag start / drag end notification for drag sources.
 *
 * Qt widgets have no dragstart/dragend events of their own; DraggableBinding sends
 * these to its element around QDrag::exec(). The handler of the Start phase writes
 * into mimeData() and reports through setSessionOpened() whether a drag began.
 */
class DragGestureEvent : public QEvent
{
public:
    enum class Phase { Start, End };

    DragGestureEvent(Phase phase,
                     const QPointF& position,
                     Qt::KeyboardModifiers modifiers,
                     QMimeData* mimeData = nullptr);

    static QEvent::Type eventType();

    Phase phase() const { return m_phase; }
    QPointF position() const { return m_position; }
    Qt::KeyboardModifiers modifiers() const { return m_modifiers; }
    QMimeData* mimeData() const { return m_mimeData; }

    Qt::DropActions supportedActions() const { return m_supportedActions; }
    void setSupportedActions(Qt::DropActions actions) { m_supportedActions = actions; }

    bool sessionOpened() const { return m_sessionOpened; }
    void setSessionOpened(bool opened) { m_sessionOpened = opened; }

private:
    Phase m_phase;
    QPointF m_position;
    Qt::KeyboardModifiers m_modifiers;
    QMimeData* m_mimeData = nullptr;
    Qt::DropActions m_supportedActions = Qt::IgnoreAction;
    bool m_sessionOpened = false;
};
