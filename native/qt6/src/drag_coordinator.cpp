#include "drag_coordinator.h"

#include "dnd_settings.h"
#include "drag_bindings.h"
#include "log_manager.h"

#include <QDebug>
#include <QMimeData>
#include <QWidget>

DragCoordinator::DragCoordinator(QWidget* viewport, QObject* parent)
    : QObject(parent)
    , m_viewport(viewport)
    , m_normalizer(viewport)
    , m_resolver(viewport)
    , m_announcer(viewport)
{
}

DragCoordinator::~DragCoordinator()
{
    m_active.reset();
    m_monitors.clear();
    m_dropTargets.clear();
}

DndCleanup DragCoordinator::draggable(const DraggableArgs& args)
{
    if (!args.element) {
        qWarning() << "[DragCoordinator] draggable() called without an element";
        return [] {};
    }

    QPointer<DraggableBinding> binding = new DraggableBinding(this, args);
    return [binding]() {
        if (!binding) return;
        binding->detach();
        binding->deleteLater();
    };
}

DndCleanup DragCoordinator::dropTargetForElements(const DropTargetArgs& args)
{
    if (!args.element) {
        qWarning() << "[DragCoordinator] dropTargetForElements() called without an element";
        return [] {};
    }

    auto* raw = new DropTargetBinding(this, args);
    m_dropTargets.insert(args.element, raw);

    QPointer<DropTargetBinding> binding = raw;
    return [binding]() {
        if (!binding) return;
        binding->detach();
        binding->deleteLater();
    };
}

DndCleanup DragCoordinator::monitorForElements(const MonitorArgs& args)
{
    const quint64 id = m_monitors.add(args);
    QPointer<DragCoordinator> self(this);
    return [self, id]() {
        if (self) self->m_monitors.remove(id);
    };
}

QPointF DragCoordinator::normalizePointerCoordinates(qreal x, qreal y) const
{
    return m_normalizer.map(x, y);
}

std::optional<ResolvedDestination> DragCoordinator::resolveDestinationFromPointer(qreal x, qreal y) const
{
    return m_resolver.resolve(QPointF(x, y));
}

void DragCoordinator::announce(const QString& message)
{
    m_announcer.announce(message);
}

void DragCoordinator::cleanup()
{
    m_announcer.cleanup();
}

void DragCoordinator::applySettings(const DndSettings& settings)
{
    m_normalizer.setMode(settings.pointerNormalization());
    m_normalizer.setDevicePixelRatioOverride(settings.devicePixelRatioOverride());
    m_verbose = settings.verboseLogging();
}

DragInput DragCoordinator::readInput(QWidget* element, const QPointF& localPos, Qt::KeyboardModifiers modifiers)
{
    QPointF raw = localPos;
    if (element && m_viewport && element != m_viewport) {
        if (m_viewport->isAncestorOf(element)) {
            raw = element->mapTo(m_viewport.data(), localPos);
        } else {
            raw = m_viewport->mapFromGlobal(element->mapToGlobal(localPos));
        }
    }

    const QPointF p = m_normalizer.normalize(raw.x(), raw.y());
    return DragInput::fromPoint(p, modifiers.testFlag(Qt::AltModifier));
}

DragInput DragCoordinator::lastInput() const
{
    if (m_active) return m_active->currentLocation.input;
    if (const auto p = m_normalizer.lastKnownPoint()) return DragInput::fromPoint(*p);
    return DragInput();
}

bool DragCoordinator::beginDrag(const DraggableArgs& args, const DragInput& input, QMimeData* mimeData)
{
    if (m_active) {
        qWarning() << "[DragCoordinator] Drag start ignored, a session is already active";
        return false;
    }

    const QVariant data = args.getInitialData ? args.getInitialData() : QVariant();
    if (!data.isValid()) return false;

    ActiveDrag drag;
    drag.source = DragSource{ data, args.element };
    drag.sourceOnDrop = args.onDrop;
    drag.currentLocation = DragLocation::empty(input);
    drag.previousLocation = DragLocation::empty(input);
    m_active = drag;

    if (mimeData) {
        mimeData->setData(QString::fromLatin1(DndKeys::InternalMime), QByteArrayLiteral("1"));
        mimeData->setText(QString::fromLatin1(DndKeys::PlainTextMarker));
    }

    log(QStringLiteral("drag started at (%1, %2)").arg(input.clientX).arg(input.clientY));

    const DragSource source = drag.source;
    if (args.onDragStart) args.onDragStart();
    m_monitors.notifyDragStart(source);
    emit dragStarted();
    return true;
}

void DragCoordinator::endDragFrom(QWidget* element, const DragInput& input)
{
    if (!m_active || m_active->source.element.data() != element) return;
    finalize(input);
}

DragLocation DragCoordinator::resolveLocation(const DropTargetBinding* binding, const DragInput& input) const
{
    // Innermost target wins; a nested target with nothing to offer defers to the
    // nearest registered ancestor.
    for (const DropTargetBinding* b = binding; b; b = dropTargetAncestor(b->element())) {
        DragLocation location = b->resolveOwnLocation(input);
        if (!location.isEmpty()) return location;
    }
    return DragLocation::empty(input);
}

const DropTargetBinding* DragCoordinator::dropTargetAncestor(const QWidget* element) const
{
    if (!element) return nullptr;
    for (QWidget* w = element->parentWidget(); w; w = w->parentWidget()) {
        const auto it = m_dropTargets.constFind(w);
        if (it != m_dropTargets.cend()) return it.value();
    }
    return nullptr;
}

void DragCoordinator::updateLocation(const DragLocation& next)
{
    if (!m_active) return;

    if (areDropTargetsEqual(m_active->currentLocation.dropTargets, next.dropTargets)) {
        m_active->currentLocation = next;
        return;
    }

    m_active->previousLocation = m_active->currentLocation;
    m_active->currentLocation = next;

    const DragSource source = m_active->source;
    const DragLocationHistory history{ m_active->currentLocation, m_active->previousLocation };
    if (m_verbose) {
        const QString key = next.isEmpty() ? QStringLiteral("<none>") : dropTargetKey(next.dropTargets.first());
        log(QStringLiteral("drop target changed: %1").arg(key));
    }
    m_monitors.notifyDropTargetChange(source, history);
}

void DragCoordinator::finalize(const DragInput& input)
{
    if (!m_active || m_finalizing) return;

    const DragLocation current = m_active->currentLocation.isEmpty()
        ? DragLocation::empty(input)
        : m_active->currentLocation;
    const DragLocationHistory history{ current, m_active->previousLocation };
    const DragSource source = m_active->source;
    const std::function<void()> sourceOnDrop = m_active->sourceOnDrop;
    const bool dropped = !current.isEmpty();

    // Drop handlers may rebuild rows and tear down the source's bindings.
    m_finalizing = true;
    m_monitors.notifyDrop(source, history);
    if (sourceOnDrop) sourceOnDrop();
    m_finalizing = false;

    m_active.reset();
    m_normalizer.resetLastKnownPoint();

    log(dropped ? QStringLiteral("drop finalized on %1").arg(dropTargetKey(current.dropTargets.first()))
                : QStringLiteral("drag finalized without a drop target"));
    emit dragFinished(dropped);
}

void DragCoordinator::releaseElement(QWidget* element)
{
    if (!m_active || m_finalizing) return;
    // A null source means the source widget is already being destroyed.
    if (!m_active->source.element.isNull() && m_active->source.element.data() != element) return;

    m_active.reset();
    m_normalizer.resetLastKnownPoint();
    log(QStringLiteral("session cleared, its source was unregistered"));
    emit dragFinished(false);
}

void DragCoordinator::unregisterDropTarget(DropTargetBinding* binding)
{
    for (auto it = m_dropTargets.begin(); it != m_dropTargets.end();) {
        if (it.value() == binding) it = m_dropTargets.erase(it);
        else ++it;
    }
}

void DragCoordinator::log(const QString& message) const
{
    if (!m_verbose) return;
    LogManager::instance().addLog(QStringLiteral("[DragCoordinator] ") + message, "DEBUG");
}
