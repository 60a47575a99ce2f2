#include "live_announcer.h"

#include <QAccessible>
#include <QAccessibleWidget>
#include <QDebug>
#include <QLabel>
#include <QWidget>
#include <QtGlobal>

namespace {

// Exposes the live region as a status surface whose name is the current text.
class LiveRegionAccessible : public QAccessibleWidget {
public:
    explicit LiveRegionAccessible(QLabel* label)
        : QAccessibleWidget(label, QAccessible::StatusBar)
    {
    }

    QString text(QAccessible::Text t) const override
    {
        if (t == QAccessible::Name) return static_cast<QLabel*>(widget())->text();
        return QAccessibleWidget::text(t);
    }
};

QAccessibleInterface* liveRegionFactory(const QString& className, QObject* object)
{
    if (className != QLatin1String("QLabel") || !object) return nullptr;
    if (object->objectName() != QLatin1String(LiveAnnouncer::RegionId)) return nullptr;
    return new LiveRegionAccessible(static_cast<QLabel*>(object));
}

void installLiveRegionFactory()
{
    static bool installed = false;
    if (installed) return;
    QAccessible::installFactory(liveRegionFactory);
    installed = true;
}

} // namespace

LiveAnnouncer::LiveAnnouncer(QWidget* host, QObject* parent)
    : QObject(parent)
    , m_host(host)
{
    installLiveRegionFactory();
    m_timer.setSingleShot(true);
    m_timer.setInterval(AnnounceDelayMs);
    connect(&m_timer, &QTimer::timeout, this, &LiveAnnouncer::flushPending);
}

LiveAnnouncer::~LiveAnnouncer()
{
    cleanup();
}

void LiveAnnouncer::setHost(QWidget* host)
{
    if (m_host == host) return;
    cleanup();
    m_host = host;
}

QLabel* LiveAnnouncer::ensureLiveRegion()
{
    if (m_region) return m_region.data();
    if (!m_host) {
        qWarning() << "[LiveAnnouncer] No host widget, announcement dropped";
        return nullptr;
    }

    if (auto* existing = m_host->findChild<QLabel*>(QLatin1String(RegionId))) {
        m_region = existing;
        return existing;
    }

    auto* region = new QLabel(m_host);
    region->setObjectName(QLatin1String(RegionId));
    region->setAccessibleDescription(tr("Drag and drop status"));
    region->setAttribute(Qt::WA_TransparentForMouseEvents);
    region->setFocusPolicy(Qt::NoFocus);
    // Visually hidden: one pixel, parked outside the host's visible area.
    region->setGeometry(-1, -1, 1, 1);
    region->show();
    m_region = region;
    return region;
}

void LiveAnnouncer::announce(const QString& message)
{
    if (message.trimmed().isEmpty()) return;

    QLabel* region = ensureLiveRegion();
    if (!region) return;

    m_timer.stop();
    region->clear();
    m_pending = message;
    m_timer.start();
}

void LiveAnnouncer::flushPending()
{
    if (!m_region) return;
    m_region->setText(m_pending);

    if (QAccessible::isActive()) {
        QAccessibleEvent nameChanged(m_region.data(), QAccessible::NameChanged);
        QAccessible::updateAccessibility(&nameChanged);
#if QT_VERSION >= QT_VERSION_CHECK(6, 8, 0)
        QAccessibleAnnouncementEvent announcement(m_region.data(), m_pending);
        announcement.setPoliteness(QAccessible::AnnouncementPoliteness::Polite);
        QAccessible::updateAccessibility(&announcement);
#endif
    }

    emit announced(m_pending);
}

void LiveAnnouncer::cleanup()
{
    m_timer.stop();
    m_pending.clear();
    if (m_region) {
        delete m_region.data();
    }
    m_region = nullptr;
}
