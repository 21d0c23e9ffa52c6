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

#include "TrashWorker.h"

#include "LoggingCategories.h"
#include "PlatformUtils.h"

namespace {
struct TrashWorkerConstants {
    static constexpr int emptyCount = 0;
    static constexpr int singleStep = 1;
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
};

QVariantMap failureEntry(const QString &path, const QString &reason, bool unsupported)
{
    QVariantMap entry;
    entry.insert("path", path);
    entry.insert("reason", reason);
    entry.insert("unsupported", unsupported);
    return entry;
}
} // namespace

TrashWorker::TrashWorker(const QStringList &paths, RemovalMode mode, QObject *parent)
    : QObject(parent)
    , m_paths(paths)
    , m_mode(mode)
{
}

TrashWorker::RemovalMode TrashWorker::mode() const
{
    return m_mode;
}

void TrashWorker::cancel()
{
    m_cancelled.storeRelaxed(TrashWorkerConstants::cancelled);
}

bool TrashWorker::isCancelled() const
{
    return m_cancelled.loadRelaxed() != TrashWorkerConstants::notCancelled;
}

void TrashWorker::tick(int &completed, int total)
{
    completed += TrashWorkerConstants::singleStep;
    emit progress(completed, total);
}

bool TrashWorker::removePath(const QString &path, QString *error, bool *unsupported) const
{
    if (m_mode == DeletePermanently) {
        return PlatformUtils::deletePermanently(path, error);
    }
    return PlatformUtils::moveToTrash(path, error, unsupported);
}

void TrashWorker::start()
{
    QVariantMap result;
    result.insert("ok", false);

    const int total = m_paths.size();
    if (total <= TrashWorkerConstants::emptyCount) {
        result.insert("deleted", TrashWorkerConstants::emptyCount);
        result.insert("failed", TrashWorkerConstants::emptyCount);
        result.insert("remaining", TrashWorkerConstants::emptyCount);
        result.insert("deletedPaths", QStringList());
        result.insert("failures", QVariantList());
        result.insert("error", tr("Nothing to delete"));
        emit finished(result);
        return;
    }

    qCInfo(lcDelete) << "Removing" << total << "files"
                     << (m_mode == DeletePermanently ? "permanently" : "to trash");

    int completed = TrashWorkerConstants::emptyCount;
    int deleted = TrashWorkerConstants::emptyCount;
    int failed = TrashWorkerConstants::emptyCount;
    QString firstError;
    QStringList deletedPaths;
    deletedPaths.reserve(total);
    QVariantList failures;

    emit progress(completed, total);

    for (const QString &path : m_paths) {
        if (isCancelled()) {
            if (firstError.isEmpty()) {
                firstError = tr("Delete cancelled");
            }
            break;
        }

        QString error;
        bool unsupported = false;
        if (!removePath(path, &error, &unsupported)) {
            failed += TrashWorkerConstants::singleStep;
            if (error.isEmpty()) {
                error = (m_mode == DeletePermanently)
                    ? tr("Failed to delete")
                    : tr("Failed to move to trash");
            }
            if (firstError.isEmpty()) {
                firstError = error;
            }
            qCWarning(lcDelete) << "Could not remove" << path << ":" << error;
            failures.append(failureEntry(path, error, unsupported));
            tick(completed, total);
            continue;
        }

        deletedPaths.append(path);
        deleted += TrashWorkerConstants::singleStep;
        tick(completed, total);
    }

    const bool cancelled = isCancelled() && completed < total;
    result.insert("deleted", deleted);
    result.insert("failed", failed);
    result.insert("remaining", total - completed);
    result.insert("deletedPaths", deletedPaths);
    result.insert("failures", failures);
    if (!firstError.isEmpty()) {
        result.insert("error", firstError);
    }
    if (cancelled) {
        result.insert("cancelled", true);
    }
    result.insert("ok", failed == TrashWorkerConstants::emptyCount && !cancelled);

    qCInfo(lcDelete) << "Removal finished:" << deleted << "removed," << failed << "failed,"
                     << (total - completed) << "not processed";
    emit finished(result);
}
