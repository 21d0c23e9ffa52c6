#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

#include "ModelFileRecord.h"

class ResultTable
{
public:
    ResultTable();

    void reset();
    int appendRecords(const ModelFileRecordList &records);
    int removePaths(const QStringList &paths);

    int totalCount() const;
    int visibleCount() const;
    const ModelFileRecord &recordAt(int row) const;
    ModelFileRecordList visibleRecords() const;
    int rowForPath(const QString &path) const;
    bool contains(const QString &path) const;

    ModelSort::Field sortField() const;
    Qt::SortOrder sortOrder() const;
    void setSortKey(ModelSort::Field field, Qt::SortOrder order);
    void toggleSortField(ModelSort::Field field);

    QString filterText() const;
    void setFilter(const QString &text);

    bool isSelected(const QString &path) const;
    bool toggleSelect(const QString &path);
    bool setSelected(const QString &path, bool selected);
    int selectAll();
    int selectNone();
    SelectionSummary selectionSummary() const;
    QStringList selectedPaths() const;

    const ScanResultSet &resultSet() const;

private:
    bool matchesFilter(const ModelFileRecord &record) const;
    void rebuildIndex();
    void rebuildVisible();
    void mergeVisible(int first);
    QVector<int> matchingIndices(int first) const;
    std::function<bool(int, int)> lessThan() const;
    void sortIndices(QVector<int> &indices) const;
    int setVisibleSelection(bool selected);

    ScanResultSet m_set;
    QHash<QString, int> m_indexByPath;
    QVector<int> m_visible;
};
