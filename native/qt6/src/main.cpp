#include <QApplication>
#include <QDebug>
#include <QFileInfo>
#include <QFrame>
#include <QLabel>
#include <QScrollArea>
#include <QStringList>
#include <QVBoxLayout>
#include <QWidget>

#include "closest_edge.h"
#include "dnd_attributes.h"
#include "dnd_settings.h"
#include "drag_coordinator.h"
#include "drop_policy.h"
#include "external_drag_tracker.h"
#include "log_manager.h"

namespace {

struct DemoLocation {
    int id;
    QString name;
    QStringList folders;
    QStringList documents;
};

QString describeTarget(const DropTarget& target)
{
    const auto d = DestinationData::fromVariant(target.data);
    if (!d) return QStringLiteral("nothing");
    switch (d->targetType) {
    case DestinationData::TargetType::Document: {
        const auto edge = ClosestEdge::extract(target.data);
        const QString where = edge ? (*edge == Edge::Top ? "before" : "after") : "onto";
        return QString("%1 %2").arg(where, d->relPath);
    }
    case DestinationData::TargetType::Folder:
        return QString("folder %1").arg(d->folderPath);
    case DestinationData::TargetType::Location:
        break;
    }
    return QString("location %1").arg(d->locationId);
}

QString describeSource(const DragSource& source)
{
    const QVariantMap m = source.data.toMap();
    return m.value("title", m.value("relPath")).toString();
}

QLabel* makeRow(const QString& text, int indent, QWidget* parent)
{
    auto* row = new QLabel(text, parent);
    row->setContentsMargins(8 + indent * 14, 4, 8, 4);
    row->setMinimumHeight(26);
    return row;
}

void wireFolderRow(DragCoordinator& dnd, QLabel* row, int locationId, const QString& folderPath)
{
    DndAttributes::markFolderRow(row, locationId, folderPath);

    dnd.draggable({ row,
                    [locationId, folderPath]() -> QVariant {
                        return QVariantMap{ { "type", "folder" }, { "locationId", locationId }, { "relPath", folderPath } };
                    },
                    {}, {} });

    dnd.dropTargetForElements({ row,
                                [locationId, folderPath](const DragSource& source) {
                                    return DropPolicy::canDropDocumentIntoFolder(source.data, locationId, folderPath)
                                        || DropPolicy::canDropFolderIntoFolder(source.data, locationId, folderPath);
                                },
                                [locationId, folderPath](const DragSource&, const DragInput&) -> QVariant {
                                    DestinationData d;
                                    d.locationId = locationId;
                                    d.folderPath = folderPath;
                                    d.targetType = DestinationData::TargetType::Folder;
                                    return d.toVariantMap();
                                } });
}

void wireDocumentRow(DragCoordinator& dnd, QLabel* row, int locationId, const QString& relPath)
{
    DndAttributes::markDocumentRow(row, locationId, relPath);
    const QString title = QFileInfo(relPath).completeBaseName();

    dnd.draggable({ row,
                    [locationId, relPath, title]() -> QVariant {
                        return QVariantMap{ { "type", "document" }, { "locationId", locationId },
                                            { "relPath", relPath }, { "title", title } };
                    },
                    [row]() { row->setEnabled(false); },
                    [row]() { row->setEnabled(true); } });

    QWidget* viewport = dnd.viewport();
    dnd.dropTargetForElements({ row,
                                [locationId, relPath](const DragSource& source) {
                                    return DropPolicy::canReorderDocument(source.data, locationId, relPath);
                                },
                                [row, viewport, locationId, relPath](const DragSource&, const DragInput& input) {
                                    DestinationData d;
                                    d.locationId = locationId;
                                    d.relPath = relPath;
                                    d.targetType = DestinationData::TargetType::Document;
                                    return ClosestEdge::attach(d.toVariantMap(),
                                                               { input, row, { Edge::Top, Edge::Bottom }, viewport });
                                } });
}

QWidget* buildLocation(DragCoordinator& dnd, const DemoLocation& location, QWidget* parent)
{
    auto* root = new QFrame(parent);
    root->setFrameShape(QFrame::StyledPanel);
    DndAttributes::markLocationRoot(root, location.id);

    auto* layout = new QVBoxLayout(root);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(makeRow(location.name, 0, root));

    for (const QString& folder : location.folders) {
        auto* row = makeRow(QFileInfo(folder).fileName() + "/", folder.count('/') + 1, root);
        wireFolderRow(dnd, row, location.id, folder);
        layout->addWidget(row);
    }
    for (const QString& doc : location.documents) {
        auto* row = makeRow(QFileInfo(doc).fileName(), doc.count('/') + 1, root);
        wireDocumentRow(dnd, row, location.id, doc);
        layout->addWidget(row);
    }

    const int locationId = location.id;
    dnd.dropTargetForElements({ root,
                                [](const DragSource& source) {
                                    const QString type = source.data.toMap().value("type").toString();
                                    return type == "document" || type == "folder";
                                },
                                [locationId](const DragSource&, const DragInput&) -> QVariant {
                                    DestinationData d;
                                    d.locationId = locationId;
                                    return d.toVariantMap();
                                } });
    return root;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QCoreApplication::setOrganizationName("WriterDnd");
    QCoreApplication::setApplicationName("WriterDnd");

    // Centralized message handler: qDebug/qWarning end up in writer-dnd.log
    qInstallMessageHandler(customMessageHandler);
    LogManager::instance().addLog("Sidebar drag-and-drop demo starting", "INFO");

    QWidget window;
    window.setWindowTitle("Writer sidebar");
    window.resize(320, 560);

    DragCoordinator dnd(&window);
    dnd.applySettings(DndSettings::instance());

    auto* scroll = new QScrollArea(&window);
    scroll->setWidgetResizable(true);
    auto* content = new QWidget(scroll);
    auto* contentLayout = new QVBoxLayout(content);

    const QList<DemoLocation> locations = {
        { 1, "Notes", { "journal", "journal/2026", "drafts" },
          { "journal/monday.md", "journal/2026/plan.md", "drafts/essay.md", "inbox.md" } },
        { 2, "Archive", { "samples", "samples/inner" }, { "samples/old.md", "readme.md" } },
    };
    for (const DemoLocation& location : locations) {
        contentLayout->addWidget(buildLocation(dnd, location, content));
    }
    contentLayout->addStretch(1);
    scroll->setWidget(content);

    auto* windowLayout = new QVBoxLayout(&window);
    windowLayout->setContentsMargins(0, 0, 0, 0);
    windowLayout->addWidget(scroll);

    QPointer<QWidget> highlighted;
    const DndCleanup stopMonitor = dnd.monitorForElements({
        {},
        [&dnd](const DragSource& source) {
            dnd.announce(QString("Dragging %1").arg(describeSource(source)));
        },
        [&dnd, &highlighted](const DragSource&, const DragLocationHistory& location) {
            if (highlighted) highlighted->setStyleSheet(QString());
            highlighted = location.current.isEmpty() ? nullptr : location.current.dropTargets.first().element.data();
            if (highlighted) highlighted->setStyleSheet("background: rgba(88, 166, 255, 60);");
            if (!location.current.isEmpty()) {
                dnd.announce(QString("Over %1").arg(describeTarget(location.current.dropTargets.first())));
            }
        },
        [&dnd, &highlighted](const DragSource& source, const DragLocationHistory& location) {
            if (highlighted) highlighted->setStyleSheet(QString());
            highlighted = nullptr;
            if (location.current.isEmpty()) {
                dnd.announce(QString("Drag of %1 cancelled").arg(describeSource(source)));
                return;
            }
            const QString target = describeTarget(location.current.dropTargets.first());
            qInfo() << "[Demo] Move requested:" << describeSource(source) << "->" << target;
            dnd.announce(QString("Dropped %1 %2").arg(describeSource(source), target));
        },
    });

    ExternalDragTracker external(&dnd);
    external.setSelectedLocationId(1);
    external.attachTo(&window);
    QObject::connect(&external, &ExternalDragTracker::dropped,
                     [](int locationId, const QString& folderPath, const QStringList& paths) {
                         qInfo() << "[Demo] External drop on location" << locationId << folderPath << paths;
                     });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&dnd, &external, stopMonitor]() {
        external.detach();
        stopMonitor();
        dnd.cleanup();
    });

    window.show();
    return app.exec();
}
