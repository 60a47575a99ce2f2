#pragma once

#include <QString>
#include <QVariant>

/**
 * DropPolicy - semantic rules layered on top of geometric resolution.
 *
 * Payloads are the QVariantMaps published by sidebar drag sources:
 *   document: { type: "document", locationId, relPath, title }
 *   folder:   { type: "folder", locationId, relPath }
 * Anything else (tabs, null, non-maps) never satisfies a document/folder rule.
 */
namespace DropPolicy {

// Folder part of a rel path: "a/b/c.md" -> "a/b", "c.md" -> "".
QString parentFolderOf(const QString& relPath);

bool canDropDocumentIntoFolder(const QVariant& dragPayload, int targetLocationId, const QString& targetFolderPath);

bool canDropFolderIntoFolder(const QVariant& dragPayload, int targetLocationId, const QString& targetFolderPath);

// Reordering onto another document row of the same location.
bool canReorderDocument(const QVariant& dragPayload, int targetLocationId, const QString& targetRelPath);

} // namespace DropPolicy
