#include "pointer_normalizer.h"

#include <QWidget>

#include <algorithm>
#include <cmath>

PointerNormalizer::PointerNormalizer(QWidget* viewport)
    : m_viewport(viewport)
{
}

void PointerNormalizer::setViewport(QWidget* viewport)
{
    m_viewport = viewport;
}

QSizeF PointerNormalizer::viewportSize() const
{
    if (m_sizeOverride.isValid()) return m_sizeOverride;
    if (m_viewport) return QSizeF(m_viewport->size());
    return QSizeF(0, 0);
}

qreal PointerNormalizer::devicePixelRatio() const
{
    if (m_ratioOverride > 0.0) return m_ratioOverride;
    if (m_viewport) {
        const qreal r = m_viewport->devicePixelRatioF();
        if (r > 0.0) return r;
    }
    return 1.0;
}

bool PointerNormalizer::isInViewport(const QPointF& p) const
{
    const QSizeF size = viewportSize();
    return p.x() >= 0 && p.y() >= 0 && p.x() <= size.width() && p.y() <= size.height();
}

QPointF PointerNormalizer::clampToViewport(const QPointF& p) const
{
    const QSizeF size = viewportSize();
    return QPointF(std::clamp(p.x(), 0.0, std::max(0.0, size.width())),
                   std::clamp(p.y(), 0.0, std::max(0.0, size.height())));
}

QPointF PointerNormalizer::heuristic(const QPointF& direct, const QPointF& scaled) const
{
    const bool directValid = isInViewport(direct);
    const bool scaledValid = isInViewport(scaled);

    if (directValid) return direct;
    if (scaledValid) return scaled;
    if (m_lastKnown) return *m_lastKnown;
    return clampToViewport(direct);
}

QPointF PointerNormalizer::normalize(qreal rawX, qreal rawY)
{
    const QPointF result = map(rawX, rawY);
    m_lastKnown = result;
    return result;
}

QPointF PointerNormalizer::map(qreal rawX, qreal rawY) const
{
    if (!std::isfinite(rawX)) rawX = 0;
    if (!std::isfinite(rawY)) rawY = 0;

    const QPointF direct(rawX, rawY);
    const qreal ratio = devicePixelRatio();
    const QPointF scaled(rawX / ratio, rawY / ratio);

    QPointF result;
    switch (m_mode) {
    case Mode::Direct:
        result = clampToViewport(direct);
        break;
    case Mode::Scaled:
        result = clampToViewport(scaled);
        break;
    case Mode::Heuristic:
        result = heuristic(direct, scaled);
        break;
    }
    return result;
}

QString PointerNormalizer::modeToString(Mode mode)
{
    switch (mode) {
    case Mode::Direct:
        return QStringLiteral("direct");
    case Mode::Scaled:
        return QStringLiteral("scaled");
    case Mode::Heuristic:
        break;
    }
    return QStringLiteral("heuristic");
}

PointerNormalizer::Mode PointerNormalizer::modeFromString(const QString& value, Mode fallback)
{
    const QString v = value.trimmed().toLower();
    if (v == QLatin1String("heuristic")) return Mode::Heuristic;
    if (v == QLatin1String("direct")) return Mode::Direct;
    if (v == QLatin1String("scaled")) return Mode::Scaled;
    return fallback;
}
