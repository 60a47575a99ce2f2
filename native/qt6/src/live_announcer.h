#pragma once

#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>

class QLabel;
class QWidget;

/**
 * LiveAnnouncer - speaks short drag status strings to assistive technology.
 *
 * A single visually hidden label (the live region) is created lazily under the host
 * widget and reused. Each announcement clears the text first and sets it after a
 * short delay so screen readers pick up repeated identical messages.
 */
class LiveAnnouncer : public QObject {
    Q_OBJECT

public:
    static constexpr char RegionId[] = "writer-dnd-live-region";
    static constexpr int AnnounceDelayMs = 10;

    explicit LiveAnnouncer(QWidget* host, QObject* parent = nullptr);
    ~LiveAnnouncer() override;

    void setHost(QWidget* host);
    QWidget* host() const { return m_host.data(); }

    void announce(const QString& message);
    void cleanup();

    // Null until the first non-blank announcement.
    QLabel* liveRegion() const { return m_region.data(); }
    bool hasPendingAnnouncement() const { return m_timer.isActive(); }

signals:
    void announced(const QString& message);

private slots:
    void flushPending();

private:
    QLabel* ensureLiveRegion();

    QPointer<QWidget> m_host;
    QPointer<QLabel> m_region;
    QTimer m_timer;
    QString m_pending;
};
