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

#include "ModelScanModel.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QThread>
#include <QtConcurrent>

#include "FormatUtils.h"
#include "LoggingCategories.h"
#include "PlatformUtils.h"
#include "ScanWorker.h"
#include "SpreadsheetExportUtils.h"
#include "TrashWorker.h"

namespace {

/**
 * @brief Compares two records on every attribute shown by the view.
 * @param left First record to compare.
 * @param right Second record to compare.
 * @return True when the records render identically.
 */
bool recordEquivalent(const ModelFileRecord &left, const ModelFileRecord &right)
{
    return left.path == right.path
        && left.sizeBytes == right.sizeBytes
        && left.lastAccessTime == right.lastAccessTime
        && left.lastWriteTime == right.lastWriteTime
        && left.creationTime == right.creationTime
        && left.selected == right.selected;
}

struct ModelScanConstants {
    static constexpr int emptyCount = 0;
    static constexpr int unknownTotal = 0;
};

} // namespace

/**
 * @brief Constructs the model from the persisted settings.
 * @param settings Folder, sort, delete mode and theme to start from.
 * @param parent Parent QObject for ownership.
 */
ModelScanModel::ModelScanModel(const AppSettings &settings, QObject *parent)
    : QAbstractListModel(parent)
    , m_settings(settings)
{
    qRegisterMetaType<ModelFileRecordList>("ModelFileRecordList");
    m_table.setSortKey(m_settings.sortField, m_settings.sortOrder);
    m_settings.sortField = m_table.sortField();
    refreshStatusText();
}

ModelScanModel::~ModelScanModel()
{
    if (m_scanWorker) {
        m_scanWorker->cancel();
    }
    if (m_trashWorker) {
        m_trashWorker->cancel();
    }
    if (m_workerThread) {
        m_workerThread->quit();
        m_workerThread->wait();
    }
    if (m_exportWatcher) {
        m_exportWatcher->waitForFinished();
    }
}

AppSettings ModelScanModel::settings() const
{
    return m_settings;
}

QString ModelScanModel::rootPath() const
{
    return m_settings.rootPath;
}

/**
 * @brief Sets the folder to scan. Discards the current results.
 * @param path Folder path.
 */
void ModelScanModel::setRootPath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (busy() || trimmed == m_settings.rootPath) {
        return;
    }
    const bool samePath = !trimmed.isEmpty() && !m_settings.rootPath.isEmpty()
        && PlatformUtils::normalizePath(trimmed) == PlatformUtils::normalizePath(m_settings.rootPath);
    m_settings.rootPath = trimmed;
    if (!samePath) {
        clearResults();
    }
    emit rootPathChanged();
    emit settingsChanged();
}

bool ModelScanModel::rootPathValid() const
{
    if (m_settings.rootPath.isEmpty()) {
        return false;
    }
    const QFileInfo info(m_settings.rootPath);
    return info.exists() && info.isDir();
}

QString ModelScanModel::filterText() const
{
    return m_table.filterText();
}

/**
 * @brief Sets the filter and updates visible rows incrementally.
 * @param text Case-insensitive text matched against path, name and extension.
 */
void ModelScanModel::setFilterText(const QString &text)
{
    if (busy() || text == m_table.filterText()) {
        return;
    }
    m_table.setFilter(text);
    applyRowsIncremental(m_table.visibleRecords());
    emit filterTextChanged();
    refreshStatusText();
}

ModelScanModel::SortField ModelScanModel::sortField() const
{
    return static_cast<SortField>(m_table.sortField());
}

void ModelScanModel::setSortField(SortField field)
{
    if (busy() || static_cast<ModelSort::Field>(field) == m_table.sortField()) {
        return;
    }
    m_table.setSortKey(static_cast<ModelSort::Field>(field), m_table.sortOrder());
    m_settings.sortField = m_table.sortField();
    resetRows();
    emit sortChanged();
    emit settingsChanged();
}

Qt::SortOrder ModelScanModel::sortOrder() const
{
    return m_table.sortOrder();
}

void ModelScanModel::setSortOrder(Qt::SortOrder order)
{
    if (busy() || order == m_table.sortOrder()) {
        return;
    }
    m_table.setSortKey(m_table.sortField(), order);
    m_settings.sortOrder = order;
    resetRows();
    emit sortChanged();
    emit settingsChanged();
}

/**
 * @brief Sorts by a column the way a header click does.
 * @param field Column picked; the same column flips direction, a new one starts ascending.
 */
void ModelScanModel::sortBy(SortField field)
{
    if (busy()) {
        return;
    }
    m_table.toggleSortField(static_cast<ModelSort::Field>(field));
    m_settings.sortField = m_table.sortField();
    m_settings.sortOrder = m_table.sortOrder();
    resetRows();
    emit sortChanged();
    emit settingsChanged();
}

bool ModelScanModel::moveToTrash() const
{
    return m_settings.moveToTrash;
}

void ModelScanModel::setMoveToTrash(bool enabled)
{
    if (enabled == m_settings.moveToTrash) {
        return;
    }
    m_settings.moveToTrash = enabled;
    emit moveToTrashChanged();
    emit settingsChanged();
}

QString ModelScanModel::theme() const
{
    return m_settings.theme;
}

void ModelScanModel::setTheme(const QString &theme)
{
    const QString next = theme == QLatin1String("Dark") ? QStringLiteral("Dark") : QStringLiteral("Light");
    if (next == m_settings.theme) {
        return;
    }
    m_settings.theme = next;
    emit themeChanged();
    emit settingsChanged();
}

ModelScanModel::Operation ModelScanModel::operation() const
{
    return m_operation;
}

bool ModelScanModel::busy() const
{
    return m_operation != Idle;
}

int ModelScanModel::progressCompleted() const
{
    return m_progressCompleted;
}

int ModelScanModel::progressTotal() const
{
    return m_progressTotal;
}

QString ModelScanModel::statusText() const
{
    return m_statusText;
}

int ModelScanModel::selectedCount() const
{
    return m_table.selectionSummary().count;
}

qint64 ModelScanModel::selectedBytes() const
{
    return m_table.selectionSummary().totalBytes;
}

QString ModelScanModel::selectionText() const
{
    const SelectionSummary summary = m_table.selectionSummary();
    if (summary.count == ModelScanConstants::emptyCount) {
        return tr("Selected: 0 files");
    }
    return tr("Selected: %1 files, %2").arg(summary.count).arg(FormatUtils::formatBytes(summary.totalBytes));
}

int ModelScanModel::totalCount() const
{
    return m_table.totalCount();
}

const ResultTable &ModelScanModel::table() const
{
    return m_table;
}

int ModelScanModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_rows.size();
}

QVariant ModelScanModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_rows.size()) {
        return {};
    }

    const ModelFileRecord &record = m_rows.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
    case NameRole:
        return record.name;
    case PathRole:
        return record.path;
    case DirectoryRole:
        return QDir::toNativeSeparators(record.directory);
    case ExtensionRole:
        return record.extension;
    case SizeRole:
        return record.sizeBytes;
    case SizeTextRole:
        return FormatUtils::formatBytes(record.sizeBytes);
    case LastAccessTimeRole:
        return record.lastAccessTime;
    case LastAccessTextRole:
        return FormatUtils::formatDateTime(record.lastAccessTime);
    case LastWriteTextRole:
        return FormatUtils::formatDateTime(record.lastWriteTime);
    case CreationTextRole:
        return FormatUtils::formatDateTime(record.creationTime);
    case SelectedRole:
        return record.selected;
    default:
        return {};
    }
}

QHash<int, QByteArray> ModelScanModel::roleNames() const
{
    return {
        {NameRole, "name"},
        {PathRole, "path"},
        {DirectoryRole, "directory"},
        {ExtensionRole, "extension"},
        {SizeRole, "sizeBytes"},
        {SizeTextRole, "sizeText"},
        {LastAccessTimeRole, "lastAccessTime"},
        {LastAccessTextRole, "lastAccessText"},
        {LastWriteTextRole, "lastWriteText"},
        {CreationTextRole, "creationText"},
        {SelectedRole, "selected"},
    };
}

/**
 * @brief Starts a background scan of the root folder, replacing the current results.
 * @return True when the scan was started, false when another operation is running.
 */
bool ModelScanModel::startScan()
{
    if (busy()) {
        return false;
    }

    clearResults();

    auto *thread = new QThread(this);
    auto *worker = new ScanWorker(m_settings.rootPath);
    worker->moveToThread(thread);

    m_workerThread = thread;
    m_scanWorker = worker;
    setOperation(Scanning);
    updateProgress(ModelScanConstants::emptyCount, ModelScanConstants::unknownTotal);
    setStatusText(tr("Scanning..."));

    connect(thread, &QThread::started, worker, &ScanWorker::start);
    connect(worker, &ScanWorker::recordsFound, this, &ModelScanModel::appendScannedRecords);
    connect(worker, &ScanWorker::progress, this, [this](int visited, int found) {
        updateProgress(visited, ModelScanConstants::unknownTotal);
        setStatusText(tr("Scanning... %1 entries checked, %2 model files found").arg(visited).arg(found));
    });
    connect(worker, &ScanWorker::finished, this, [this, thread](const QVariantMap &result) {
        m_scanWorker = nullptr;
        m_workerThread = nullptr;
        thread->quit();
        thread->wait();

        setOperation(Idle);
        updateProgress(ModelScanConstants::emptyCount, ModelScanConstants::emptyCount);
        refreshStatusText();
        emit scanFinished(result);
    });
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();
    return true;
}

/**
 * @brief Starts removing the selected files using the current delete mode.
 * @return True when the removal was started, false when busy or nothing is selected.
 */
bool ModelScanModel::startDelete()
{
    if (busy()) {
        return false;
    }
    const QStringList paths = m_table.selectedPaths();
    if (paths.isEmpty()) {
        QVariantMap result;
        result.insert("ok", false);
        result.insert("error", tr("Nothing to delete"));
        emit deleteFinished(result);
        return false;
    }

    auto *thread = new QThread(this);
    const TrashWorker::RemovalMode mode = m_settings.moveToTrash ? TrashWorker::MoveToTrash : TrashWorker::DeletePermanently;
    auto *worker = new TrashWorker(paths, mode);
    worker->moveToThread(thread);

    m_workerThread = thread;
    m_trashWorker = worker;
    setOperation(Deleting);
    updateProgress(ModelScanConstants::emptyCount, paths.size());
    setStatusText(mode == TrashWorker::MoveToTrash
        ? tr("Moving %1 files to trash...").arg(paths.size())
        : tr("Deleting %1 files permanently...").arg(paths.size()));

    connect(thread, &QThread::started, worker, &TrashWorker::start);
    connect(worker, &TrashWorker::progress, this, &ModelScanModel::updateProgress);
    connect(worker, &TrashWorker::finished, this, [this, thread](const QVariantMap &result) {
        m_trashWorker = nullptr;
        m_workerThread = nullptr;
        thread->quit();
        thread->wait();

        const QStringList deletedPaths = result.value("deletedPaths").toStringList();
        if (m_table.removePaths(deletedPaths) > ModelScanConstants::emptyCount) {
            applyRowsIncremental(m_table.visibleRecords());
            emit countsChanged();
        }
        notifySelectionChanged();

        setOperation(Idle);
        updateProgress(ModelScanConstants::emptyCount, ModelScanConstants::emptyCount);
        refreshStatusText();
        emit deleteFinished(result);
    });
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();
    return true;
}

/**
 * @brief Writes the visible rows, in visible order, to a spreadsheet in the background.
 * @param path Output file; ".xlsx" is appended when missing.
 * @param openAfterExport True to try opening the file once written.
 * @return True when the export was started, false otherwise.
 */
bool ModelScanModel::startExport(const QString &path, bool openAfterExport)
{
    if (busy()) {
        return false;
    }

    const QString targetPath = SpreadsheetExportUtils::ensureXlsxSuffix(path);
    const ModelFileRecordList rows = m_table.visibleRecords();
    if (rows.isEmpty()) {
        QVariantMap result;
        result.insert("ok", false);
        result.insert("path", targetPath);
        result.insert("error", tr("Nothing to export"));
        emit exportFinished(result);
        return false;
    }

    setOperation(Exporting);
    updateProgress(ModelScanConstants::emptyCount, rows.size());
    setStatusText(tr("Exporting %1 rows...").arg(rows.size()));

    auto future = QtConcurrent::run([rows, targetPath]() {
        QVariantMap result;
        QString error;
        const bool ok = SpreadsheetExportUtils::writeWorkbook(rows, targetPath, &error);
        result.insert("ok", ok);
        result.insert("path", targetPath);
        result.insert("rows", rows.size());
        if (!ok) {
            result.insert("error", error);
        }
        return result;
    });

    auto *watcher = new QFutureWatcher<QVariantMap>(this);
    m_exportWatcher = watcher;
    connect(watcher, &QFutureWatcher<QVariantMap>::finished, this, [this, watcher, openAfterExport]() {
        QVariantMap result = watcher->result();
        watcher->deleteLater();
        m_exportWatcher = nullptr;

        bool opened = false;
        if (result.value("ok").toBool() && openAfterExport) {
            opened = PlatformUtils::openInSpreadsheetApplication(result.value("path").toString());
            if (!opened) {
                qCDebug(lcExport) << "No application opened" << result.value("path").toString();
            }
        }
        result.insert("opened", opened);

        setOperation(Idle);
        updateProgress(ModelScanConstants::emptyCount, ModelScanConstants::emptyCount);
        refreshStatusText();
        emit exportFinished(result);
    });
    watcher->setFuture(future);
    return true;
}

/**
 * @brief Requests cancellation of the running scan or removal.
 */
void ModelScanModel::cancelOperation()
{
    if (m_scanWorker) {
        m_scanWorker->cancel();
    }
    if (m_trashWorker) {
        m_trashWorker->cancel();
    }
}

void ModelScanModel::toggleSelected(int row)
{
    if (row < 0 || row >= m_rows.size()) {
        return;
    }
    setSelected(row, !m_rows.at(row).selected);
}

void ModelScanModel::setSelected(int row, bool selected)
{
    if (busy() || row < 0 || row >= m_rows.size()) {
        return;
    }
    if (m_rows.at(row).selected == selected) {
        return;
    }
    m_table.setSelected(m_rows.at(row).path, selected);
    m_rows[row].selected = selected;
    emit dataChanged(index(row, 0), index(row, 0), {SelectedRole});
    notifySelectionChanged();
}

bool ModelScanModel::isSelected(int row) const
{
    if (row < 0 || row >= m_rows.size()) {
        return false;
    }
    return m_rows.at(row).selected;
}

QString ModelScanModel::pathForRow(int row) const
{
    if (row < 0 || row >= m_rows.size()) {
        return QString();
    }
    return m_rows.at(row).path;
}

/**
 * @brief Selects the visible rows only.
 */
void ModelScanModel::selectAll()
{
    if (busy()) {
        return;
    }
    if (m_table.selectAll() > ModelScanConstants::emptyCount) {
        syncSelectedRole();
        notifySelectionChanged();
    }
}

/**
 * @brief Clears the visible rows only.
 */
void ModelScanModel::selectNone()
{
    if (busy()) {
        return;
    }
    if (m_table.selectNone() > ModelScanConstants::emptyCount) {
        syncSelectedRole();
        notifySelectionChanged();
    }
}

/**
 * @brief Returns selection totals over every scanned record.
 * @return Map with "count" and "bytes" fields.
 */
QVariantMap ModelScanModel::selectionStats() const
{
    const SelectionSummary summary = m_table.selectionSummary();
    QVariantMap result;
    result.insert("count", summary.count);
    result.insert("bytes", summary.totalBytes);
    return result;
}

QString ModelScanModel::formatBytes(qint64 bytes) const
{
    return FormatUtils::formatBytes(bytes);
}

QString ModelScanModel::localPathFromUrl(const QUrl &url) const
{
    return PlatformUtils::localPathFromUrl(url);
}

void ModelScanModel::setOperation(Operation operation)
{
    if (operation == m_operation) {
        return;
    }
    m_operation = operation;
    emit operationChanged();
}

void ModelScanModel::updateProgress(int completed, int total)
{
    if (completed == m_progressCompleted && total == m_progressTotal) {
        return;
    }
    m_progressCompleted = completed;
    m_progressTotal = total;
    emit progressChanged();
}

void ModelScanModel::setStatusText(const QString &text)
{
    if (text == m_statusText) {
        return;
    }
    m_statusText = text;
    emit statusTextChanged();
}

void ModelScanModel::refreshStatusText()
{
    if (busy()) {
        return;
    }
    const int total = m_table.totalCount();
    const int shown = m_table.visibleCount();
    if (total == ModelScanConstants::emptyCount) {
        setStatusText(tr("Ready."));
    } else if (!m_table.filterText().trimmed().isEmpty()) {
        setStatusText(tr("Showing %1 of %2 files (filtered).").arg(shown).arg(total));
    } else {
        setStatusText(tr("Showing %1 files.").arg(shown));
    }
}

void ModelScanModel::appendScannedRecords(const ModelFileRecordList &records)
{
    if (m_table.appendRecords(records) <= ModelScanConstants::emptyCount) {
        return;
    }
    applyRowsIncremental(m_table.visibleRecords());
    emit countsChanged();
}

void ModelScanModel::resetRows()
{
    beginResetModel();
    m_rows = m_table.visibleRecords();
    endResetModel();
    refreshStatusText();
}

/**
 * @brief Applies an incremental update of visible rows to the model.
 * @param rows New visible rows in display order.
 */
void ModelScanModel::applyRowsIncremental(const ModelFileRecordList &rows)
{
    QSet<QString> nextPaths;
    nextPaths.reserve(rows.size());
    for (const ModelFileRecord &record : rows) {
        nextPaths.insert(record.path);
    }

    for (int last = m_rows.size() - 1; last >= 0; --last) {
        if (nextPaths.contains(m_rows.at(last).path)) {
            continue;
        }
        int first = last;
        while (first > 0 && !nextPaths.contains(m_rows.at(first - 1).path)) {
            first -= 1;
        }
        beginRemoveRows(QModelIndex(), first, last);
        m_rows.remove(first, last - first + 1);
        endRemoveRows();
        last = first;
    }

    QSet<QString> currentPaths;
    currentPaths.reserve(m_rows.size());
    for (const ModelFileRecord &record : m_rows) {
        currentPaths.insert(record.path);
    }

    int i = 0;
    while (i < rows.size()) {
        const QString &nextPath = rows.at(i).path;
        if (i < m_rows.size() && m_rows.at(i).path == nextPath) {
            if (!recordEquivalent(m_rows.at(i), rows.at(i))) {
                m_rows[i] = rows.at(i);
                emit dataChanged(index(i, 0), index(i, 0));
            }
            i += 1;
            continue;
        }

        if (!currentPaths.contains(nextPath)) {
            beginInsertRows(QModelIndex(), i, i);
            m_rows.insert(i, rows.at(i));
            endInsertRows();
            currentPaths.insert(nextPath);
            i += 1;
            continue;
        }

        int existing = -1;
        for (int j = i + 1; j < m_rows.size(); j += 1) {
            if (m_rows.at(j).path == nextPath) {
                existing = j;
                break;
            }
        }
        if (existing >= 0) {
            beginMoveRows(QModelIndex(), existing, existing, QModelIndex(), i);
            const ModelFileRecord moved = m_rows.takeAt(existing);
            m_rows.insert(i, moved);
            endMoveRows();
            if (!recordEquivalent(m_rows.at(i), rows.at(i))) {
                m_rows[i] = rows.at(i);
                emit dataChanged(index(i, 0), index(i, 0));
            }
        }
        i += 1;
    }

    refreshStatusText();
}

void ModelScanModel::syncSelectedRole()
{
    if (m_rows.isEmpty()) {
        return;
    }
    for (ModelFileRecord &record : m_rows) {
        record.selected = m_table.isSelected(record.path);
    }
    emit dataChanged(index(0, 0), index(m_rows.size() - 1, 0), {SelectedRole});
}

void ModelScanModel::notifySelectionChanged()
{
    emit selectionChanged();
}

void ModelScanModel::clearResults()
{
    const bool hadSelection = m_table.selectionSummary().count > ModelScanConstants::emptyCount;
    beginResetModel();
    m_table.reset();
    m_rows.clear();
    endResetModel();
    emit countsChanged();
    if (hadSelection) {
        notifySelectionChanged();
    }
    refreshStatusText();
}
