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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDesktopServices>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUrl>

namespace PlatformUtils {

namespace {

bool checkRemovable(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Source not found");
        }
        return false;
    }
    if (info.isDir() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is a folder");
        }
        return false;
    }
    return true;
}

} // namespace

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Normalized absolute path using forward separators.
 */
QString normalizePath(const QString &path)
{
    QString normalized = QDir::fromNativeSeparators(path.trimmed());
    if (normalized.isEmpty()) {
        return normalized;
    }
    normalized = QDir(normalized).absolutePath();
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

/**
 * @brief Converts a dialog URL to a local path, including drive-letter paths on Windows.
 * @param url File URL or bare path.
 * @return Local path, or an empty string for non-local URLs.
 */
QString localPathFromUrl(const QUrl &url)
{
    if (url.isLocalFile()) {
        return url.toLocalFile();
    }
    if (url.scheme().isEmpty()) {
        return url.path();
    }
    return QString();
}

/**
 * @brief Returns the default ComfyUI folder for the current platform.
 * @return Default folder path to scan.
 */
QString defaultModelsDir()
{
#ifdef Q_OS_WIN
    const QString documents = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    const QString base = documents.isEmpty() ? QDir::home().filePath("Documents") : documents;
    return QDir(base).filePath("ComfyUI");
#else
    return QDir::home().filePath("ComfyUI");
#endif
}

/**
 * @brief Reports whether the platform offers a trash facility Qt can move files into.
 * @return True when QFile::moveToTrash is backed by a real trash, false otherwise.
 */
bool trashAvailable()
{
#if defined(Q_OS_ANDROID) || defined(Q_OS_IOS) || defined(Q_OS_WASM)
    return false;
#elif defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return true;
#elif defined(Q_OS_UNIX)
    return !QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation).isEmpty();
#else
    return false;
#endif
}

/**
 * @brief Moves a file to the platform trash. Never falls back to deletion.
 * @param path File path to remove.
 * @param error Optional output error message.
 * @param unsupported Optional output set to true when the platform has no trash.
 * @return True if the file was moved to trash, false otherwise.
 */
bool moveToTrash(const QString &path, QString *error, bool *unsupported)
{
    if (unsupported) {
        *unsupported = false;
    }
    if (!trashAvailable()) {
        if (unsupported) {
            *unsupported = true;
        }
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Trash is not available on this platform");
        }
        return false;
    }
    if (!checkRemovable(path, error)) {
        return false;
    }
    QFile file(path);
    if (!file.moveToTrash()) {
        if (error) {
            const QString detail = file.errorString();
            *error = detail.isEmpty()
                ? QCoreApplication::translate("PlatformUtils", "Failed to move to trash")
                : QCoreApplication::translate("PlatformUtils", "Failed to move to trash: %1").arg(detail);
        }
        return false;
    }
    return true;
}

bool deletePermanently(const QString &path, QString *error)
{
    if (!checkRemovable(path, error)) {
        return false;
    }
    QFile file(path);
    if (!file.remove()) {
        if (error) {
            const QString detail = file.errorString();
            *error = detail.isEmpty()
                ? QCoreApplication::translate("PlatformUtils", "Failed to delete")
                : QCoreApplication::translate("PlatformUtils", "Failed to delete: %1").arg(detail);
        }
        return false;
    }
    return true;
}

/**
 * @brief Opens a spreadsheet with the application registered for its type.
 * @param path Spreadsheet file path.
 * @return True when the desktop accepted the request, false otherwise.
 */
bool openInSpreadsheetApplication(const QString &path)
{
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return false;
    }
    return QDesktopServices::openUrl(QUrl::fromLocalFile(QFileInfo(path).absoluteFilePath()));
}

} // namespace PlatformUtils
