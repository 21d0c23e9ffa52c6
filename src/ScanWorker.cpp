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

#include "ScanWorker.h"

#include "LoggingCategories.h"
#include "ModelScanner.h"

namespace {
struct ScanWorkerConstants {
    static constexpr int batchSize = 64;
    static constexpr int progressInterval = 256;
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
};
} // namespace

ScanWorker::ScanWorker(const QString &rootPath, QObject *parent)
    : QObject(parent)
    , m_rootPath(rootPath)
{
}

void ScanWorker::cancel()
{
    m_cancelled.storeRelaxed(ScanWorkerConstants::cancelled);
}

bool ScanWorker::isCancelled() const
{
    return m_cancelled.loadRelaxed() != ScanWorkerConstants::notCancelled;
}

void ScanWorker::flush(ModelFileRecordList &batch)
{
    if (batch.isEmpty()) {
        return;
    }
    emit recordsFound(batch);
    batch.clear();
}

void ScanWorker::start()
{
    QVariantMap result;
    result.insert("ok", false);

    ModelScanner scanner(m_rootPath);
    QString error;
    if (!scanner.open(&error)) {
        qCWarning(lcScan) << "Scan failed:" << error;
        result.insert("found", 0);
        result.insert("visited", 0);
        result.insert("skipped", 0);
        result.insert("error", error);
        emit finished(result);
        return;
    }

    qCInfo(lcScan) << "Scanning" << scanner.rootPath();
    emit progress(0, 0);

    int found = 0;
    int lastReported = 0;
    ModelFileRecordList batch;
    batch.reserve(ScanWorkerConstants::batchSize);

    ModelFileRecord record;
    bool exhausted = false;
    while (!isCancelled()) {
        const ModelScanner::Step step = scanner.step(&record);
        if (step == ModelScanner::Finished) {
            exhausted = true;
            break;
        }
        if (step == ModelScanner::Found) {
            batch.append(record);
            found += 1;
            if (batch.size() >= ScanWorkerConstants::batchSize) {
                flush(batch);
            }
        }
        if (scanner.visitedCount() - lastReported >= ScanWorkerConstants::progressInterval) {
            lastReported = scanner.visitedCount();
            emit progress(lastReported, found);
        }
    }
    flush(batch);
    emit progress(scanner.visitedCount(), found);

    const bool cancelled = !exhausted;
    result.insert("found", found);
    result.insert("visited", scanner.visitedCount());
    result.insert("skipped", scanner.skippedCount());
    if (cancelled) {
        result.insert("cancelled", true);
        result.insert("error", tr("Scan cancelled"));
    }
    result.insert("ok", !cancelled);

    qCInfo(lcScan) << "Scan finished:" << found << "found," << scanner.skippedCount() << "skipped,"
                   << scanner.visitedCount() << "visited" << (cancelled ? "(cancelled)" : "");
    emit finished(result);
}
