#include "monitor_registry.h"

#include <QList>

quint64 MonitorRegistry::add(const MonitorArgs& args)
{
    const quint64 id = m_nextId++;
    m_monitors.insert(id, args);
    return id;
}

bool MonitorRegistry::remove(quint64 id)
{
    return m_monitors.remove(id) > 0;
}

void MonitorRegistry::dispatch(const DragSource& source, const std::function<void(const MonitorArgs&)>& call) const
{
    const QList<quint64> ids = m_monitors.keys();
    for (quint64 id : ids) {
        const auto it = m_monitors.constFind(id);
        if (it == m_monitors.cend()) continue;
        // Copy: the callback may unregister itself.
        const MonitorArgs monitor = it.value();
        if (monitor.canMonitor && !monitor.canMonitor(source)) continue;
        call(monitor);
    }
}

void MonitorRegistry::notifyDragStart(const DragSource& source) const
{
    dispatch(source, [&source](const MonitorArgs& m) {
        if (m.onDragStart) m.onDragStart(source);
    });
}

void MonitorRegistry::notifyDropTargetChange(const DragSource& source, const DragLocationHistory& location) const
{
    dispatch(source, [&source, &location](const MonitorArgs& m) {
        if (m.onDropTargetChange) m.onDropTargetChange(source, location);
    });
}

void MonitorRegistry::notifyDrop(const DragSource& source, const DragLocationHistory& location) const
{
    dispatch(source, [&source, &location](const MonitorArgs& m) {
        if (m.onDrop) m.onDrop(source, location);
    });
}
