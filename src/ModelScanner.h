#pragma once

#include <QString>

#include <memory>

#include "ModelFileRecord.h"

class QDirIterator;

class ModelScanner
{
public:
    enum Step {
        Found = 0,
        Visited,
        Finished
    };

    explicit ModelScanner(const QString &rootPath);
    ~ModelScanner();

    ModelScanner(const ModelScanner &) = delete;
    ModelScanner &operator=(const ModelScanner &) = delete;

    QString rootPath() const;

    bool open(QString *error);
    Step step(ModelFileRecord *record);
    bool next(ModelFileRecord *record);

    int visitedCount() const;
    int skippedCount() const;

private:
    bool readRecord(const QString &path, ModelFileRecord *record);

    QString m_rootPath;
    std::unique_ptr<QDirIterator> m_iterator;
    int m_visited = 0;
    int m_skipped = 0;
};
