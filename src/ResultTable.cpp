/************************************************************************\

    Modelman - Model file manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "ResultTable.h"

#include <QCollator>
#include <QSet>

#include <algorithm>
#include <iterator>
#include <memory>

namespace {

int compareTimes(const QDateTime &left, const QDateTime &right)
{
    if (left < right) {
        return -1;
    }
    if (right < left) {
        return 1;
    }
    return 0;
}

int compareRecords(const ModelFileRecord &left,
                   const ModelFileRecord &right,
                   ModelSort::Field field,
                   const QCollator &collator)
{
    switch (field) {
    case ModelSort::Path:
        return collator.compare(left.path, right.path);
    case ModelSort::Directory:
        return collator.compare(left.directory, right.directory);
    case ModelSort::Extension:
        return collator.compare(left.extension, right.extension);
    case ModelSort::Size:
        if (left.sizeBytes == right.sizeBytes) {
            return 0;
        }
        return left.sizeBytes < right.sizeBytes ? -1 : 1;
    case ModelSort::LastAccessTime:
        return compareTimes(left.lastAccessTime, right.lastAccessTime);
    case ModelSort::LastWriteTime:
        return compareTimes(left.lastWriteTime, right.lastWriteTime);
    case ModelSort::CreationTime:
        return compareTimes(left.creationTime, right.creationTime);
    case ModelSort::Name:
    default:
        return collator.compare(left.name, right.name);
    }
}

} // namespace

ResultTable::ResultTable() = default;

/**
 * @brief Drops every record and the selection, keeping sort and filter.
 */
void ResultTable::reset()
{
    m_set.records.clear();
    m_indexByPath.clear();
    m_visible.clear();
}

/**
 * @brief Appends scanned records, ignoring paths already present.
 * @param records Records to append in scan order.
 * @return Number of records actually added.
 */
int ResultTable::appendRecords(const ModelFileRecordList &records)
{
    const int first = m_set.records.size();
    for (const ModelFileRecord &record : records) {
        if (record.path.isEmpty() || m_indexByPath.contains(record.path)) {
            continue;
        }
        m_indexByPath.insert(record.path, m_set.records.size());
        m_set.records.append(record);
    }
    const int added = m_set.records.size() - first;
    if (added > 0) {
        mergeVisible(first);
    }
    return added;
}

/**
 * @brief Removes the records matching the given paths.
 * @param paths Paths to drop.
 * @return Number of records removed.
 */
int ResultTable::removePaths(const QStringList &paths)
{
    if (paths.isEmpty()) {
        return 0;
    }
    const QSet<QString> doomed(paths.cbegin(), paths.cend());
    const int before = m_set.records.size();
    m_set.records.erase(std::remove_if(m_set.records.begin(), m_set.records.end(), [&](const ModelFileRecord &record) {
        return doomed.contains(record.path);
    }), m_set.records.end());
    const int removed = before - m_set.records.size();
    if (removed > 0) {
        rebuildIndex();
        rebuildVisible();
    }
    return removed;
}

int ResultTable::totalCount() const
{
    return m_set.records.size();
}

int ResultTable::visibleCount() const
{
    return m_visible.size();
}

const ModelFileRecord &ResultTable::recordAt(int row) const
{
    Q_ASSERT(row >= 0 && row < m_visible.size());
    return m_set.records.at(m_visible.at(row));
}

ModelFileRecordList ResultTable::visibleRecords() const
{
    ModelFileRecordList rows;
    rows.reserve(m_visible.size());
    for (int index : m_visible) {
        rows.append(m_set.records.at(index));
    }
    return rows;
}

int ResultTable::rowForPath(const QString &path) const
{
    const auto it = m_indexByPath.constFind(path);
    if (it == m_indexByPath.constEnd()) {
        return -1;
    }
    return m_visible.indexOf(it.value());
}

bool ResultTable::contains(const QString &path) const
{
    return m_indexByPath.contains(path);
}

ModelSort::Field ResultTable::sortField() const
{
    return m_set.sortField;
}

Qt::SortOrder ResultTable::sortOrder() const
{
    return m_set.sortOrder;
}

/**
 * @brief Sets the sort field and direction, then reorders visible rows.
 * @param field Field to sort by.
 * @param order Ascending or descending order.
 */
void ResultTable::setSortKey(ModelSort::Field field, Qt::SortOrder order)
{
    if (field < ModelSort::firstField || field > ModelSort::lastField) {
        field = ModelSort::LastAccessTime;
    }
    if (field == m_set.sortField && order == m_set.sortOrder) {
        return;
    }
    m_set.sortField = field;
    m_set.sortOrder = order;
    rebuildVisible();
}

/**
 * @brief Flips the direction for the active field, or starts a new field ascending.
 * @param field Field that was picked.
 */
void ResultTable::toggleSortField(ModelSort::Field field)
{
    if (field == m_set.sortField) {
        setSortKey(field, m_set.sortOrder == Qt::AscendingOrder ? Qt::DescendingOrder : Qt::AscendingOrder);
        return;
    }
    setSortKey(field, Qt::AscendingOrder);
}

QString ResultTable::filterText() const
{
    return m_set.filterText;
}

/**
 * @brief Restricts visible rows to records whose path, name or extension contain the text.
 * @param text Case-insensitive filter text; empty shows every record.
 */
void ResultTable::setFilter(const QString &text)
{
    if (text == m_set.filterText) {
        return;
    }
    m_set.filterText = text;
    rebuildVisible();
}

bool ResultTable::isSelected(const QString &path) const
{
    const auto it = m_indexByPath.constFind(path);
    if (it == m_indexByPath.constEnd()) {
        return false;
    }
    return m_set.records.at(it.value()).selected;
}

bool ResultTable::toggleSelect(const QString &path)
{
    return setSelected(path, !isSelected(path));
}

/**
 * @brief Sets the selected flag of a single record.
 * @param path Record path.
 * @param selected New selection state.
 * @return True when the record exists, false otherwise.
 */
bool ResultTable::setSelected(const QString &path, bool selected)
{
    const auto it = m_indexByPath.constFind(path);
    if (it == m_indexByPath.constEnd()) {
        return false;
    }
    m_set.records[it.value()].selected = selected;
    return true;
}

/**
 * @brief Selects every visible row; rows hidden by the filter are left untouched.
 * @return Number of rows whose state changed.
 */
int ResultTable::selectAll()
{
    return setVisibleSelection(true);
}

/**
 * @brief Clears every visible row; rows hidden by the filter are left untouched.
 * @return Number of rows whose state changed.
 */
int ResultTable::selectNone()
{
    return setVisibleSelection(false);
}

/**
 * @brief Sums the selection over the full record set, ignoring the filter.
 * @return Count and total byte size of selected records.
 */
SelectionSummary ResultTable::selectionSummary() const
{
    SelectionSummary summary;
    for (const ModelFileRecord &record : m_set.records) {
        if (record.selected) {
            summary.count += 1;
            summary.totalBytes += record.sizeBytes;
        }
    }
    return summary;
}

QStringList ResultTable::selectedPaths() const
{
    QStringList paths;
    for (const ModelFileRecord &record : m_set.records) {
        if (record.selected) {
            paths.append(record.path);
        }
    }
    return paths;
}

const ScanResultSet &ResultTable::resultSet() const
{
    return m_set;
}

bool ResultTable::matchesFilter(const ModelFileRecord &record) const
{
    const QString needle = m_set.filterText.trimmed();
    if (needle.isEmpty()) {
        return true;
    }
    return record.path.contains(needle, Qt::CaseInsensitive)
        || record.name.contains(needle, Qt::CaseInsensitive)
        || record.extension.contains(needle, Qt::CaseInsensitive);
}

void ResultTable::rebuildIndex()
{
    m_indexByPath.clear();
    m_indexByPath.reserve(m_set.records.size());
    for (int i = 0; i < m_set.records.size(); ++i) {
        m_indexByPath.insert(m_set.records.at(i).path, i);
    }
}

void ResultTable::rebuildVisible()
{
    m_visible = matchingIndices(0);
    sortIndices(m_visible);
}

/**
 * @brief Merges records appended from the given index into the sorted visible rows.
 * @param first Index of the first appended record.
 */
void ResultTable::mergeVisible(int first)
{
    QVector<int> incoming = matchingIndices(first);
    if (incoming.isEmpty()) {
        return;
    }
    sortIndices(incoming);

    // on equal keys std::merge takes from the first range, so older records stay ahead
    QVector<int> merged;
    merged.reserve(m_visible.size() + incoming.size());
    std::merge(m_visible.cbegin(), m_visible.cend(), incoming.cbegin(), incoming.cend(),
               std::back_inserter(merged), lessThan());
    m_visible = merged;
}

QVector<int> ResultTable::matchingIndices(int first) const
{
    QVector<int> indices;
    indices.reserve(m_set.records.size() - first);
    for (int i = first; i < m_set.records.size(); ++i) {
        if (matchesFilter(m_set.records.at(i))) {
            indices.append(i);
        }
    }
    return indices;
}

std::function<bool(int, int)> ResultTable::lessThan() const
{
    auto collator = std::make_shared<QCollator>();
    collator->setCaseSensitivity(Qt::CaseInsensitive);

    const ModelSort::Field field = m_set.sortField;
    const bool ascending = m_set.sortOrder == Qt::AscendingOrder;
    const ModelFileRecordList &records = m_set.records;
    return [collator, field, ascending, &records](int left, int right) {
        const int result = compareRecords(records.at(left), records.at(right), field, *collator);
        return ascending ? result < 0 : result > 0;
    };
}

void ResultTable::sortIndices(QVector<int> &indices) const
{
    // equal keys keep scan order in both directions
    std::stable_sort(indices.begin(), indices.end(), lessThan());
}

int ResultTable::setVisibleSelection(bool selected)
{
    int changed = 0;
    for (int index : m_visible) {
        ModelFileRecord &record = m_set.records[index];
        if (record.selected != selected) {
            record.selected = selected;
            changed += 1;
        }
    }
    return changed;
}
