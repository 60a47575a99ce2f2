#include "drag_bindings.h"

#include "drag_gesture_event.h"

#include <QApplication>
#include <QCursor>
#include <QDrag>
#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QGuiApplication>
#include <QMimeData>
#include <QMouseEvent>
#include <QWidget>

// ---------------------------------------------------------------------------
// DraggableBinding

DraggableBinding::DraggableBinding(DragCoordinator* coordinator, const DraggableArgs& args)
    : QObject(args.element)
    , m_coordinator(coordinator)
    , m_element(args.element)
    , m_args(args)
{
    m_element->installEventFilter(this);
}

DraggableBinding::~DraggableBinding()
{
    // Usually runs while the element itself is being destroyed; leave it alone.
    if (m_detached) return;
    m_detached = true;
    if (m_coordinator) m_coordinator->releaseElement(m_args.element);
}

void DraggableBinding::detach()
{
    if (m_detached) return;
    m_detached = true;
    m_pressed = false;

    if (m_element) m_element->removeEventFilter(this);
    if (m_coordinator) m_coordinator->releaseElement(m_args.element);
}

bool DraggableBinding::eventFilter(QObject* watched, QEvent* event)
{
    if (m_detached || watched != m_element.data()) return QObject::eventFilter(watched, event);

    if (event->type() == DragGestureEvent::eventType()) {
        handleGesture(static_cast<DragGestureEvent*>(event));
        return true;
    }

    switch (event->type()) {
    case QEvent::MouseButtonPress: {
        auto* me = static_cast<QMouseEvent*>(event);
        if (me->button() == Qt::LeftButton) {
            m_pressPos = me->position().toPoint();
            m_pressed = true;
        }
        break;
    }
    case QEvent::MouseMove: {
        auto* me = static_cast<QMouseEvent*>(event);
        if (!m_pressed || !(me->buttons() & Qt::LeftButton)) break;
        if ((me->position().toPoint() - m_pressPos).manhattanLength() < QApplication::startDragDistance()) break;
        m_pressed = false;
        runDrag(QPointF(m_pressPos), me->modifiers());
        return true;
    }
    case QEvent::MouseButtonRelease:
        m_pressed = false;
        break;
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

void DraggableBinding::handleGesture(DragGestureEvent* event)
{
    if (!m_coordinator || !m_element) return;

    const DragInput input = m_coordinator->readInput(m_element.data(), event->position(), event->modifiers());
    if (event->phase() == DragGestureEvent::Phase::Start) {
        DraggableArgs args = m_args;
        args.element = m_element.data();
        if (m_coordinator->beginDrag(args, input, event->mimeData())) {
            event->setSupportedActions(Qt::MoveAction);
            event->setSessionOpened(true);
        }
        return;
    }

    m_coordinator->endDragFrom(m_element.data(), input);
}

void DraggableBinding::runDrag(const QPointF& localPos, Qt::KeyboardModifiers modifiers)
{
    QPointer<DraggableBinding> self(this);
    QPointer<QWidget> element = m_element;

    auto* mime = new QMimeData();
    DragGestureEvent start(DragGestureEvent::Phase::Start, localPos, modifiers, mime);
    QCoreApplication::sendEvent(element.data(), &start);
    if (!start.sessionOpened()) {
        delete mime;
        return;
    }

    auto* drag = new QDrag(element.data());
    drag->setMimeData(mime);
    drag->exec(start.supportedActions(), Qt::MoveAction);

    // The drop may have unregistered this binding or destroyed the row.
    if (!self || !element) return;

    const QPointF endPos = element->mapFromGlobal(QPointF(QCursor::pos()));
    DragGestureEvent end(DragGestureEvent::Phase::End, endPos, QGuiApplication::queryKeyboardModifiers());
    QCoreApplication::sendEvent(element.data(), &end);
}

// ---------------------------------------------------------------------------
// DropTargetBinding

DropTargetBinding::DropTargetBinding(DragCoordinator* coordinator, const DropTargetArgs& args)
    : QObject(args.element)
    , m_coordinator(coordinator)
    , m_element(args.element)
    , m_args(args)
{
    m_previousAcceptDrops = m_element->acceptDrops();
    m_element->setAcceptDrops(true);
    m_element->installEventFilter(this);
}

DropTargetBinding::~DropTargetBinding()
{
    if (m_detached) return;
    m_detached = true;
    if (m_coordinator) {
        m_coordinator->unregisterDropTarget(this);
        m_coordinator->releaseElement(m_args.element);
    }
}

void DropTargetBinding::detach()
{
    if (m_detached) return;
    m_detached = true;

    if (m_element) {
        m_element->removeEventFilter(this);
        m_element->setAcceptDrops(m_previousAcceptDrops);
    }
    if (m_coordinator) {
        m_coordinator->unregisterDropTarget(this);
        m_coordinator->releaseElement(m_args.element);
    }
}

DragLocation DropTargetBinding::resolveOwnLocation(const DragInput& input) const
{
    if (m_detached || !m_coordinator || !m_element) return DragLocation::empty(input);
    const ActiveDrag* active = m_coordinator->activeDrag();
    if (!active) return DragLocation::empty(input);

    if (m_args.canDrop && !m_args.canDrop(active->source)) return DragLocation::empty(input);

    const QVariant data = m_args.getData ? m_args.getData(active->source, input) : QVariant();
    if (!isDroppablePayload(data)) return DragLocation::empty(input);

    DragLocation location;
    location.dropTargets << DropTarget{ m_element, data };
    location.input = input;
    return location;
}

bool DropTargetBinding::eventFilter(QObject* watched, QEvent* event)
{
    if (m_detached || watched != m_element.data() || !m_coordinator || !m_coordinator->isDragging()) {
        return QObject::eventFilter(watched, event);
    }

    switch (event->type()) {
    case QEvent::DragEnter:
        handleDragEnter(static_cast<QDragEnterEvent*>(event));
        return true;
    case QEvent::DragMove:
        handleDragMove(static_cast<QDragMoveEvent*>(event));
        return true;
    case QEvent::DragLeave:
        handleDragLeave(static_cast<QDragLeaveEvent*>(event));
        return true;
    case QEvent::Drop:
        handleDrop(static_cast<QDropEvent*>(event));
        return true;
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

void DropTargetBinding::handleDragEnter(QDragEnterEvent* event)
{
    const DragInput input = m_coordinator->readInput(m_element.data(), event->position(), event->modifiers());
    const DragLocation next = m_coordinator->resolveLocation(this, input);
    // Qt only delivers moves to widgets that accepted the enter.
    event->accept();
    m_coordinator->updateLocation(next);
}

void DropTargetBinding::handleDragMove(QDragMoveEvent* event)
{
    const DragInput input = m_coordinator->readInput(m_element.data(), event->position(), event->modifiers());
    const DragLocation next = m_coordinator->resolveLocation(this, input);
    if (!next.isEmpty()) {
        event->setDropAction(Qt::MoveAction);
        event->accept();
    } else {
        event->ignore();
    }
    m_coordinator->updateLocation(next);
}

void DropTargetBinding::handleDragLeave(QDragLeaveEvent* event)
{
    Q_UNUSED(event);
    QWidget* under = QApplication::widgetAt(QCursor::pos());
    if (under && (under == m_element.data() || m_element->isAncestorOf(under))) return;

    m_coordinator->updateLocation(DragLocation::empty(m_coordinator->lastInput()));
}

void DropTargetBinding::handleDrop(QDropEvent* event)
{
    const DragInput input = m_coordinator->readInput(m_element.data(), event->position(), event->modifiers());
    const DragLocation next = m_coordinator->resolveLocation(this, input);
    if (!next.isEmpty()) {
        event->setDropAction(Qt::MoveAction);
        event->accept();
    } else {
        event->ignore();
    }

    QPointer<DragCoordinator> coordinator = m_coordinator;
    coordinator->updateLocation(next);
    if (coordinator) coordinator->finalize(input);
}
