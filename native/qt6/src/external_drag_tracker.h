#pragma once

#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QString>
#include <QStringList>

#include <optional>

class DragCoordinator;
class QWidget;

struct ExternalDragEvent {
    enum class Type { Enter, Over, Drop, Other };

    Type type = Type::Other;
    QStringList paths;
    // Raw window position; may be physical pixels depending on the host.
    QPointF position;
};

struct ExternalDropTarget {
    int locationId = 0;
    QString folderPath;

    QString key() const { return QStringLiteral("%1:%2").arg(locationId).arg(folderPath); }
};

/**
 * ExternalDragTracker - follows OS drags (files from the desktop) over the sidebar.
 *
 * These drags never open a DragCoordinator session. The tracker resolves the
 * destination under the pointer with the coordinator's resolver, falling back to the
 * selected location, and reports changes and the final drop. Importing the dropped
 * files is up to whoever listens to dropped().
 */
class ExternalDragTracker : public QObject {
    Q_OBJECT

public:
    explicit ExternalDragTracker(DragCoordinator* coordinator, QObject* parent = nullptr);
    ~ExternalDragTracker() override;

    void setSelectedLocationId(std::optional<int> locationId) { m_selectedLocationId = locationId; }
    std::optional<int> selectedLocationId() const { return m_selectedLocationId; }

    // Translates Qt drag events of OS drags over window (or its children) into
    // handleEvent() calls.
    void attachTo(QWidget* window);
    void detach();

    void handleEvent(const ExternalDragEvent& event);

    std::optional<ExternalDropTarget> currentTarget() const { return m_current; }

signals:
    // locationId is -1 when the highlight should be cleared.
    void targetChanged(int locationId, const QString& folderPath);
    void dropped(int locationId, const QString& folderPath, const QStringList& paths);
    void dropIgnored(const QStringList& paths);

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    std::optional<ExternalDropTarget> resolveTarget(const QPointF& position) const;
    void setTarget(const std::optional<ExternalDropTarget>& target);
    void scheduleLeave();

    QPointer<DragCoordinator> m_coordinator;
    QPointer<QWidget> m_window;
    std::optional<int> m_selectedLocationId;
    std::optional<ExternalDropTarget> m_current;
    bool m_tracking = false;
    bool m_pendingLeave = false;
};
