#pragma once

#include <QRectF>
#include <QString>

class QWidget;

/**
 * DndAttributes - property contract between sidebar rows and the drag engine.
 *
 * Row widgets describe the workspace entity they display with dynamic properties.
 * The engine only reads them:
 *   locationId        numeric id of the owning location (int or numeric string)
 *   documentPath      rel path of a document row
 *   folderPath        rel path of a folder row
 *   dropFolderRow     marker, folder row eligible for the exhaustive scan
 *   dropDocumentRow   marker, document row eligible for the exhaustive scan
 *   dropLocationRoot  marker, location root eligible for the exhaustive scan
 */
namespace DndAttributes {

inline constexpr char LocationId[] = "locationId";
inline constexpr char DocumentPath[] = "documentPath";
inline constexpr char FolderPath[] = "folderPath";
inline constexpr char DropFolderRow[] = "dropFolderRow";
inline constexpr char DropDocumentRow[] = "dropDocumentRow";
inline constexpr char DropLocationRoot[] = "dropLocationRoot";

void markLocationRoot(QWidget* widget, int locationId);
void markFolderRow(QWidget* widget, int locationId, const QString& folderPath);
void markDocumentRow(QWidget* widget, int locationId, const QString& relPath);
void clear(QWidget* widget);

bool hasLocationId(const QWidget* widget);
bool isScanCandidate(const QWidget* widget);

// Bounding rectangle of widget in the coordinate space of viewport.
// Falls back to global mapping when viewport is not an ancestor.
QRectF boundingRect(const QWidget* widget, const QWidget* viewport);

} // namespace DndAttributes
