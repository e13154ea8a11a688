#include "queue_model.h"
#include "file_utils.h"

#include <QFileInfo>
#include <QSet>

#include <algorithm>

QueueModel::QueueModel(QObject* parent) : QAbstractListModel(parent) {}

QVariant QueueModel::data(const QModelIndex& idx, int role) const
{
    if (!idx.isValid() || idx.row() < 0 || idx.row() >= m_items.size()) return {};
    const QueueItem& it = m_items[idx.row()];
    switch (role) {
        case Qt::DisplayRole: return QString("%1  [%2]").arg(it.displayName, mediaKindName(it.kind));
        case Qt::ToolTipRole: return it.path;
        case IdRole: return it.id.toString(QUuid::WithoutBraces);
        case NameRole: return it.displayName;
        case PathRole: return it.path;
        case KindRole: return mediaKindName(it.kind);
        default: return {};
    }
}

QHash<int,QByteArray> QueueModel::roleNames() const
{
    QHash<int,QByteArray> r;
    r[IdRole] = "itemId";
    r[NameRole] = "displayName";
    r[PathRole] = "filePath";
    r[KindRole] = "kind";
    return r;
}

int QueueModel::addPaths(const QStringList& paths)
{
    QSet<QString> known;
    for (const QueueItem& it : m_items) known.insert(it.path);

    QVector<QueueItem> fresh;
    for (const QString& p : paths) {
        QFileInfo fi(p);
        if (!fi.isFile()) continue;
        const MediaKind kind = mediaKindForPath(p);
        if (kind == MediaKind::Unknown) continue;
        const QString abs = fi.absoluteFilePath();
        if (known.contains(abs)) continue;
        known.insert(abs);
        fresh.append(QueueItem{QUuid::createUuid(), fi.fileName(), abs, kind});
    }
    if (fresh.isEmpty()) return 0;

    beginInsertRows(QModelIndex(), m_items.size(), m_items.size() + fresh.size() - 1);
    m_items += fresh;
    endInsertRows();
    emit countChanged();
    return fresh.size();
}

int QueueModel::addFolder(const QString& dirPath)
{
    return addPaths(FileUtils::collectFilesRecursive(dirPath));
}

int QueueModel::removeRowsList(const QList<int>& rows)
{
    QList<int> sorted = rows;
    std::sort(sorted.begin(), sorted.end(), std::greater<int>());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    int removed = 0;
    for (int row : sorted) {
        if (row < 0 || row >= m_items.size()) continue;
        beginRemoveRows(QModelIndex(), row, row);
        m_items.removeAt(row);
        endRemoveRows();
        ++removed;
    }
    if (removed) emit countChanged();
    return removed;
}

void QueueModel::clear()
{
    if (m_items.isEmpty()) return;
    beginResetModel();
    m_items.clear();
    endResetModel();
    emit countChanged();
}

QVariantMap QueueModel::get(int row) const
{
    QVariantMap m;
    if (row < 0 || row >= m_items.size()) return m;
    const QueueItem& it = m_items[row];
    m["itemId"] = it.id.toString(QUuid::WithoutBraces);
    m["displayName"] = it.displayName;
    m["filePath"] = it.path;
    m["kind"] = mediaKindName(it.kind);
    return m;
}
