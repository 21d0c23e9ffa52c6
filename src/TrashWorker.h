#pragma once

#include <QObject>
#include <QAtomicInt>
#include <QVariantList>
#include <QVariantMap>
#include <QStringList>

class TrashWorker : public QObject
{
    Q_OBJECT

public:
    enum RemovalMode {
        MoveToTrash = 0,
        DeletePermanently
    };

    explicit TrashWorker(const QStringList &paths, RemovalMode mode = MoveToTrash, QObject *parent = nullptr);

    RemovalMode mode() const;

public slots:
    void start();
    void cancel();

signals:
    void progress(int completed, int total);
    void finished(QVariantMap result);

private:
    bool isCancelled() const;
    bool removePath(const QString &path, QString *error, bool *unsupported) const;
    void tick(int &completed, int total);

    QStringList m_paths;
    RemovalMode m_mode = MoveToTrash;
    QAtomicInt m_cancelled = 0;
};
