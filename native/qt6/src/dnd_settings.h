#pragma once

#include "pointer_normalizer.h"

#include <QObject>
#include <QSettings>
#include <QString>

/**
 * @brief DndSettings - persisted tuning of the sidebar drag engine
 *
 * Keys (QSettings, group "Dnd"):
 * "Dnd/PointerNormalization"    heuristic | direct | scaled
 * "Dnd/DevicePixelRatioOverride" 0 keeps the viewport widget's own ratio
 * "Dnd/VerboseLogging"          session lifecycle lines in the app log
 */
class DndSettings : public QObject {
    Q_OBJECT

public:
    static DndSettings& instance();

    // Uses the given store instead of the application settings; for tests and tools.
    explicit DndSettings(QSettings* store, QObject* parent = nullptr);

    PointerNormalizer::Mode pointerNormalization() const;
    void setPointerNormalization(PointerNormalizer::Mode mode);

    qreal devicePixelRatioOverride() const;
    void setDevicePixelRatioOverride(qreal ratio);

    bool verboseLogging() const;
    void setVerboseLogging(bool verbose);

    void sync();

signals:
    void settingsChanged();

private:
    DndSettings();
    DndSettings(const DndSettings&) = delete;
    DndSettings& operator=(const DndSettings&) = delete;

    QSettings* settings() const;

    mutable QSettings* m_settings = nullptr;
};
