#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVector>
#include <QtGlobal>

struct ModelFileRecord {
    QString path;
    QString name;
    QString directory;
    QString extension;
    qint64 sizeBytes = 0;
    QDateTime lastAccessTime;
    QDateTime lastWriteTime;
    QDateTime creationTime;
    bool selected = false;
};

using ModelFileRecordList = QVector<ModelFileRecord>;

namespace ModelSort {

enum Field {
    Name = 0,
    Path,
    Directory,
    Extension,
    Size,
    LastAccessTime,
    LastWriteTime,
    CreationTime
};

constexpr Field firstField = Name;
constexpr Field lastField = CreationTime;

} // namespace ModelSort

struct ScanResultSet {
    ModelFileRecordList records;
    ModelSort::Field sortField = ModelSort::LastAccessTime;
    Qt::SortOrder sortOrder = Qt::AscendingOrder;
    QString filterText;
};

struct SelectionSummary {
    int count = 0;
    qint64 totalBytes = 0;
};

Q_DECLARE_METATYPE(ModelFileRecord)
Q_DECLARE_METATYPE(ModelFileRecordList)
