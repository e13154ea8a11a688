#pragma once
#include <QAbstractListModel>
#include <QVector>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QUuid>

#include "ui/file_type_helpers.h"

struct QueueItem {
    QUuid id;
    QString displayName;
    QString path;
    MediaKind kind = MediaKind::Unknown;
};

class QueueModel : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ count NOTIFY countChanged)
public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        NameRole,
        PathRole,
        KindRole
    };
    explicit QueueModel(QObject* parent=nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override { Q_UNUSED(parent); return m_items.size(); }
    QVariant data(const QModelIndex& idx, int role) const override;
    QHash<int,QByteArray> roleNames() const override;

    int count() const { return m_items.size(); }
    const QVector<QueueItem>& items() const { return m_items; }
    QueueItem itemAt(int row) const { return m_items.value(row); }

    // Unsupported extensions and paths already queued are skipped. Returns how many were added.
    Q_INVOKABLE int addPaths(const QStringList& paths);
    Q_INVOKABLE int addFolder(const QString& dirPath);
    Q_INVOKABLE int removeRowsList(const QList<int>& rows);
    Q_INVOKABLE void clear();
    Q_INVOKABLE QVariantMap get(int row) const;

signals:
    void countChanged();

private:
    QVector<QueueItem> m_items;
};
