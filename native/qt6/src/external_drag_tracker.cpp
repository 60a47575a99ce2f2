#include "external_drag_tracker.h"

#include "dnd_types.h"
#include "drag_coordinator.h"
#include "drop_policy.h"

#include <QApplication>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QTimer>
#include <QUrl>
#include <QWidget>

namespace {

bool isExternalDrag(const QMimeData* mime)
{
    return mime && mime->hasUrls() && !mime->hasFormat(QString::fromLatin1(DndKeys::InternalMime));
}

QStringList localPaths(const QMimeData* mime)
{
    QStringList out;
    if (!mime) return out;
    for (const QUrl& url : mime->urls()) {
        if (url.isLocalFile()) out << url.toLocalFile();
    }
    return out;
}

} // namespace

ExternalDragTracker::ExternalDragTracker(DragCoordinator* coordinator, QObject* parent)
    : QObject(parent)
    , m_coordinator(coordinator)
{
}

ExternalDragTracker::~ExternalDragTracker()
{
    detach();
}

void ExternalDragTracker::attachTo(QWidget* window)
{
    detach();
    if (!window) return;
    m_window = window;
    m_window->setAcceptDrops(true);
    // Application-wide: Qt delivers OS drags to the innermost widget accepting drops,
    // which is usually a sidebar row rather than the window.
    if (qApp) qApp->installEventFilter(this);
}

void ExternalDragTracker::detach()
{
    if (qApp) qApp->removeEventFilter(this);
    m_window = nullptr;
    m_tracking = false;
    m_pendingLeave = false;
}

void ExternalDragTracker::scheduleLeave()
{
    // Moving between widgets delivers leave then enter; only a leave that is not
    // followed by an enter ends the drag.
    m_pendingLeave = true;
    QPointer<ExternalDragTracker> self(this);
    QTimer::singleShot(0, this, [self]() {
        if (!self || !self->m_pendingLeave) return;
        self->m_pendingLeave = false;
        self->m_tracking = false;
        self->handleEvent(ExternalDragEvent{});
    });
}

std::optional<ExternalDropTarget> ExternalDragTracker::resolveTarget(const QPointF& position) const
{
    std::optional<ExternalDropTarget> target;
    if (m_coordinator) {
        const QPointF p = m_coordinator->normalizePointerCoordinates(position.x(), position.y());
        if (const auto resolved = m_coordinator->resolveDestinationFromPointer(p.x(), p.y())) {
            const DestinationData& d = resolved->destination;
            ExternalDropTarget t;
            t.locationId = d.locationId;
            if (d.targetType == DestinationData::TargetType::Document) {
                t.folderPath = DropPolicy::parentFolderOf(d.relPath);
            } else {
                t.folderPath = d.folderPath;
            }
            target = t;
        }
    }

    if (!target && m_selectedLocationId) {
        target = ExternalDropTarget{ *m_selectedLocationId, QString() };
    }
    return target;
}

void ExternalDragTracker::setTarget(const std::optional<ExternalDropTarget>& target)
{
    const QString nextKey = target ? target->key() : QString();
    const QString currentKey = m_current ? m_current->key() : QString();
    m_current = target;
    if (nextKey == currentKey) return;

    if (target) emit targetChanged(target->locationId, target->folderPath);
    else emit targetChanged(-1, QString());
}

void ExternalDragTracker::handleEvent(const ExternalDragEvent& event)
{
    switch (event.type) {
    case ExternalDragEvent::Type::Enter:
    case ExternalDragEvent::Type::Over:
        setTarget(resolveTarget(event.position));
        break;
    case ExternalDragEvent::Type::Drop: {
        std::optional<ExternalDropTarget> target = m_current;
        if (!target && m_selectedLocationId) target = ExternalDropTarget{ *m_selectedLocationId, QString() };
        setTarget(std::nullopt);
        if (!target) {
            qDebug() << "[ExternalDragTracker] Drop ignored: no target location";
            emit dropIgnored(event.paths);
            return;
        }
        qDebug() << "[ExternalDragTracker] Drop of" << event.paths.size() << "path(s) on location"
                 << target->locationId << "folder" << target->folderPath;
        emit dropped(target->locationId, target->folderPath, event.paths);
        break;
    }
    case ExternalDragEvent::Type::Other:
        setTarget(std::nullopt);
        break;
    }
}

bool ExternalDragTracker::eventFilter(QObject* watched, QEvent* event)
{
    const QEvent::Type type = event->type();
    if (type != QEvent::DragEnter && type != QEvent::DragMove && type != QEvent::Drop && type != QEvent::DragLeave) {
        return QObject::eventFilter(watched, event);
    }

    auto* widget = qobject_cast<QWidget*>(watched);
    if (!m_window || !widget || (widget != m_window.data() && !m_window->isAncestorOf(widget))) {
        return QObject::eventFilter(watched, event);
    }

    auto toViewport = [this, widget](const QPointF& pos) {
        QWidget* viewport = m_coordinator ? m_coordinator->viewport() : nullptr;
        if (!viewport || viewport == widget) return pos;
        if (viewport->isAncestorOf(widget)) return widget->mapTo(viewport, pos);
        return viewport->mapFromGlobal(widget->mapToGlobal(pos));
    };

    if (type == QEvent::DragLeave) {
        if (m_tracking) scheduleLeave();
        return QObject::eventFilter(watched, event);
    }

    auto* e = static_cast<QDropEvent*>(event);
    if (!isExternalDrag(e->mimeData())) return QObject::eventFilter(watched, event);

    e->acceptProposedAction();
    m_pendingLeave = false;

    ExternalDragEvent ev;
    ev.paths = localPaths(e->mimeData());
    ev.position = toViewport(e->position());
    if (type == QEvent::Drop) {
        m_tracking = false;
        ev.type = ExternalDragEvent::Type::Drop;
    } else {
        m_tracking = true;
        ev.type = type == QEvent::DragEnter ? ExternalDragEvent::Type::Enter : ExternalDragEvent::Type::Over;
    }
    handleEvent(ev);
    return true;
}
