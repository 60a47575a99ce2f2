#include "dnd_attributes.h"

#include <QVariant>
#include <QWidget>

namespace DndAttributes {

void markLocationRoot(QWidget* widget, int locationId)
{
    if (!widget) return;
    widget->setProperty(LocationId, locationId);
    widget->setProperty(DropLocationRoot, true);
}

void markFolderRow(QWidget* widget, int locationId, const QString& folderPath)
{
    if (!widget) return;
    widget->setProperty(LocationId, locationId);
    widget->setProperty(FolderPath, folderPath);
    widget->setProperty(DocumentPath, QVariant());
    widget->setProperty(DropFolderRow, true);
}

void markDocumentRow(QWidget* widget, int locationId, const QString& relPath)
{
    if (!widget) return;
    widget->setProperty(LocationId, locationId);
    widget->setProperty(DocumentPath, relPath);
    widget->setProperty(FolderPath, QVariant());
    widget->setProperty(DropDocumentRow, true);
}

void clear(QWidget* widget)
{
    if (!widget) return;
    // Setting an invalid QVariant removes a dynamic property.
    for (const char* name : { LocationId, DocumentPath, FolderPath,
                              DropFolderRow, DropDocumentRow, DropLocationRoot }) {
        widget->setProperty(name, QVariant());
    }
}

bool hasLocationId(const QWidget* widget)
{
    return widget && widget->property(LocationId).isValid();
}

bool isScanCandidate(const QWidget* widget)
{
    if (!hasLocationId(widget)) return false;
    return widget->property(DropFolderRow).toBool()
        || widget->property(DropDocumentRow).toBool()
        || widget->property(DropLocationRoot).toBool();
}

QRectF boundingRect(const QWidget* widget, const QWidget* viewport)
{
    if (!widget) return QRectF();
    const QSizeF size(widget->size());
    if (!viewport || viewport == widget) return QRectF(QPointF(0, 0), size);

    if (viewport->isAncestorOf(widget)) {
        return QRectF(widget->mapTo(viewport, QPointF(0, 0)), size);
    }
    return QRectF(viewport->mapFromGlobal(widget->mapToGlobal(QPointF(0, 0))), size);
}

} // namespace DndAttributes
