#pragma once

#include "dnd_types.h"

#include <QMap>
#include <QtGlobal>

#include <functional>

struct MonitorArgs {
    std::function<bool(const DragSource&)> canMonitor;
    std::function<void(const DragSource&)> onDragStart;
    std::function<void(const DragSource&, const DragLocationHistory&)> onDropTargetChange;
    std::function<void(const DragSource&, const DragLocationHistory&)> onDrop;
};

/**
 * MonitorRegistry - ordered set of drag observers.
 *
 * Dispatch iterates a snapshot of subscription ids taken when it starts; a monitor
 * removed by an earlier callback of the same dispatch is skipped, one added during
 * the dispatch is not called until the next one.
 */
class MonitorRegistry
{
public:
    quint64 add(const MonitorArgs& args);
    bool remove(quint64 id);
    bool contains(quint64 id) const { return m_monitors.contains(id); }
    int size() const { return m_monitors.size(); }
    void clear() { m_monitors.clear(); }

    void notifyDragStart(const DragSource& source) const;
    void notifyDropTargetChange(const DragSource& source, const DragLocationHistory& location) const;
    void notifyDrop(const DragSource& source, const DragLocationHistory& location) const;

private:
    void dispatch(const DragSource& source, const std::function<void(const MonitorArgs&)>& call) const;

    QMap<quint64, MonitorArgs> m_monitors;
    quint64 m_nextId = 1;
};
