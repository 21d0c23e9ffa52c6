#pragma once

#include <QObject>
#include <QAtomicInt>
#include <QVariantMap>
#include <QString>

#include "ModelFileRecord.h"

class ScanWorker : public QObject
{
    Q_OBJECT

public:
    explicit ScanWorker(const QString &rootPath, QObject *parent = nullptr);

public slots:
    void start();
    void cancel();

signals:
    void recordsFound(const ModelFileRecordList &records);
    void progress(int visited, int found);
    void finished(QVariantMap result);

private:
    bool isCancelled() const;
    void flush(ModelFileRecordList &batch);

    QString m_rootPath;
    QAtomicInt m_cancelled = 0;
};
