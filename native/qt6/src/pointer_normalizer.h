#pragma once

#include <QPointF>
#include <QPointer>
#include <QSizeF>
#include <QString>

#include <optional>

class QWidget;

/**
 * PointerNormalizer - maps raw drag coordinates into one viewport space.
 *
 * Some embedding contexts report positions already multiplied by the device pixel
 * ratio, others do not, and the event does not say which. In Heuristic mode both
 * candidates are checked against the viewport:
 *   - exactly one inside  -> that one
 *   - both inside         -> the direct one
 *   - neither inside      -> last known point, else direct clamped to the viewport
 *
 * This is a compatibility shim, not ground truth. Hosts that know how their
 * coordinates are reported should pin Direct or Scaled mode.
 */
class PointerNormalizer
{
public:
    enum class Mode { Heuristic, Direct, Scaled };

    PointerNormalizer() = default;
    explicit PointerNormalizer(QWidget* viewport);

    void setViewport(QWidget* viewport);
    QWidget* viewport() const { return m_viewport.data(); }

    // Overrides win over the viewport widget's own size and ratio.
    void setViewportSizeOverride(const QSizeF& size) { m_sizeOverride = size; }
    void setDevicePixelRatioOverride(qreal ratio) { m_ratioOverride = ratio; }

    QSizeF viewportSize() const;
    qreal devicePixelRatio() const;

    void setMode(Mode mode) { m_mode = mode; }
    Mode mode() const { return m_mode; }

    // Normalizes and remembers the result as the last known point.
    QPointF normalize(qreal rawX, qreal rawY);
    // Same mapping, no state change.
    QPointF map(qreal rawX, qreal rawY) const;

    std::optional<QPointF> lastKnownPoint() const { return m_lastKnown; }
    void resetLastKnownPoint() { m_lastKnown.reset(); }

    bool isInViewport(const QPointF& p) const;

    static QString modeToString(Mode mode);
    static Mode modeFromString(const QString& value, Mode fallback = Mode::Heuristic);

private:
    QPointF clampToViewport(const QPointF& p) const;
    QPointF heuristic(const QPointF& direct, const QPointF& scaled) const;

    QPointer<QWidget> m_viewport;
    QSizeF m_sizeOverride;
    qreal m_ratioOverride = 0.0;
    Mode m_mode = Mode::Heuristic;
    std::optional<QPointF> m_lastKnown;
};
