#include "dnd_settings.h"

#include <QDebug>

namespace {
const QString kNormalizationKey = QStringLiteral("Dnd/PointerNormalization");
const QString kRatioOverrideKey = QStringLiteral("Dnd/DevicePixelRatioOverride");
const QString kVerboseKey = QStringLiteral("Dnd/VerboseLogging");
} // namespace

DndSettings& DndSettings::instance() {
    static DndSettings s;
    return s;
}

DndSettings::DndSettings()
    : QObject(nullptr)
{
    m_settings = new QSettings("WriterDnd", "WriterDnd", this);
}

DndSettings::DndSettings(QSettings* store, QObject* parent)
    : QObject(parent)
    , m_settings(store)
{
}

QSettings* DndSettings::settings() const {
    if (!m_settings) {
        m_settings = new QSettings("WriterDnd", "WriterDnd", const_cast<DndSettings*>(this));
    }
    return m_settings;
}

PointerNormalizer::Mode DndSettings::pointerNormalization() const {
    const QString raw = settings()->value(kNormalizationKey, QStringLiteral("heuristic")).toString();
    const auto mode = PointerNormalizer::modeFromString(raw, PointerNormalizer::Mode::Heuristic);
    if (PointerNormalizer::modeToString(mode) != raw.trimmed().toLower()) {
        qWarning() << "[DndSettings] Unknown pointer normalization" << raw << "- using heuristic";
    }
    return mode;
}

void DndSettings::setPointerNormalization(PointerNormalizer::Mode mode) {
    settings()->setValue(kNormalizationKey, PointerNormalizer::modeToString(mode));
    emit settingsChanged();
}

qreal DndSettings::devicePixelRatioOverride() const {
    bool ok = false;
    const qreal ratio = settings()->value(kRatioOverrideKey, 0.0).toDouble(&ok);
    if (!ok || ratio < 0.0) return 0.0;
    return ratio;
}

void DndSettings::setDevicePixelRatioOverride(qreal ratio) {
    settings()->setValue(kRatioOverrideKey, ratio > 0.0 ? ratio : 0.0);
    emit settingsChanged();
}

bool DndSettings::verboseLogging() const {
    return settings()->value(kVerboseKey, false).toBool();
}

void DndSettings::setVerboseLogging(bool verbose) {
    settings()->setValue(kVerboseKey, verbose);
    emit settingsChanged();
}

void DndSettings::sync() {
    settings()->sync();
    qDebug() << "[DndSettings] Synced to" << settings()->fileName();
}
