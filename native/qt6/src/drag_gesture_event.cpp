#include "drag_gesture_event.h"

DragGestureEvent::DragGestureEvent(Phase phase,
                                   const QPointF& position,
                                   Qt::KeyboardModifiers modifiers,
                                   QMimeData* mimeData)
    : QEvent(eventType())
    , m_phase(phase)
    , m_position(position)
    , m_modifiers(modifiers)
    , m_mimeData(mimeData)
{
}

QEvent::Type DragGestureEvent::eventType()
{
    static const int type = QEvent::registerEventType();
    return static_cast<QEvent::Type>(type);
}
