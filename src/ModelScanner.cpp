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

#include "ModelScanner.h"

#include <QCoreApplication>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include "LoggingCategories.h"
#include "ModelExtensionUtils.h"

/**
 * @brief Creates a scanner for the given root folder.
 * @param rootPath Folder to enumerate recursively.
 */
ModelScanner::ModelScanner(const QString &rootPath)
    : m_rootPath(rootPath)
{
}

ModelScanner::~ModelScanner() = default;

QString ModelScanner::rootPath() const
{
    return m_rootPath;
}

/**
 * @brief Validates the root folder and prepares the recursive walk.
 * @param error Optional output error message.
 * @return True when the root can be scanned, false otherwise.
 */
bool ModelScanner::open(QString *error)
{
    m_iterator.reset();
    m_visited = 0;
    m_skipped = 0;

    const QString trimmed = m_rootPath.trimmed();
    if (trimmed.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("ModelScanner", "No folder selected");
        }
        return false;
    }
    const QFileInfo rootInfo(trimmed);
    if (!rootInfo.exists()) {
        if (error) {
            *error = QCoreApplication::translate("ModelScanner", "Folder not found: %1").arg(trimmed);
        }
        return false;
    }
    if (!rootInfo.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("ModelScanner", "Not a folder: %1").arg(trimmed);
        }
        return false;
    }
    if (!rootInfo.isReadable() || !QDir(trimmed).isReadable()) {
        if (error) {
            *error = QCoreApplication::translate("ModelScanner", "Folder is not readable: %1").arg(trimmed);
        }
        return false;
    }

    m_iterator = std::make_unique<QDirIterator>(rootInfo.absoluteFilePath(),
                                                QDir::Files | QDir::Dirs | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                                                QDirIterator::Subdirectories);
    return true;
}

/**
 * @brief Examines exactly one entry of the walk.
 * @param record Output record, filled when the entry is a model file.
 * @return Found when a record was produced, Visited for any other entry, Finished when the walk is exhausted.
 */
ModelScanner::Step ModelScanner::step(ModelFileRecord *record)
{
    if (!m_iterator || !record) {
        return Finished;
    }
    if (!m_iterator->hasNext()) {
        m_iterator.reset();
        return Finished;
    }
    const QString path = m_iterator->next();
    m_visited += 1;
    const QFileInfo info = m_iterator->fileInfo();
    if (info.isDir()) {
        // the iterator does not descend into folders it cannot open
        if (!info.isSymLink() && (!info.isReadable() || !info.isExecutable())) {
            m_skipped += 1;
            qCDebug(lcScan) << "Skipping unreadable folder" << path;
        }
        return Visited;
    }
    if (!ModelExtensionUtils::isModelFileName(info.fileName())) {
        return Visited;
    }
    return readRecord(path, record) ? Found : Visited;
}

/**
 * @brief Advances to the next model file below the root.
 * @param record Output record for the file found.
 * @return True when a record was produced, false when the walk is exhausted.
 */
bool ModelScanner::next(ModelFileRecord *record)
{
    Step result = step(record);
    while (result == Visited) {
        result = step(record);
    }
    return result == Found;
}

int ModelScanner::visitedCount() const
{
    return m_visited;
}

int ModelScanner::skippedCount() const
{
    return m_skipped;
}

bool ModelScanner::readRecord(const QString &path, ModelFileRecord *record)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        m_skipped += 1;
        qCDebug(lcScan) << "Skipping unreadable entry" << path;
        return false;
    }
    // fifos and sockets with a model suffix
    if (!info.isFile()) {
        return false;
    }
    const QDateTime lastAccess = info.lastRead();
    if (!lastAccess.isValid()) {
        m_skipped += 1;
        qCDebug(lcScan) << "Skipping entry without access time" << path;
        return false;
    }

    ModelFileRecord next;
    next.path = info.absoluteFilePath();
    next.name = info.fileName();
    next.directory = info.absolutePath();
    next.extension = ModelExtensionUtils::normalizedExtension(next.name);
    next.sizeBytes = info.size();
    next.lastAccessTime = lastAccess;
    next.lastWriteTime = info.lastModified();
    next.creationTime = info.birthTime().isValid() ? info.birthTime() : info.metadataChangeTime();
    *record = next;
    return true;
}
