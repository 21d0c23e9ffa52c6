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

#include <QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "ModelScanModel.h"

namespace {

const QDateTime dayOne(QDate(2024, 2, 1), QTime(10, 0));
const QDateTime dayThree(QDate(2024, 2, 3), QTime(10, 0));

bool writeFile(const QString &path, qint64 size, const QDateTime &accessTime = QDateTime())
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (file.write(QByteArray(size, 'm')) != size) {
        return false;
    }
    if (accessTime.isValid() && !file.setFileTime(accessTime, QFileDevice::FileAccessTime)) {
        return false;
    }
    return true;
}

QStringList rowNames(const ModelScanModel &model)
{
    QStringList names;
    for (int row = 0; row < model.rowCount(); ++row) {
        names.append(model.data(model.index(row, 0), ModelScanModel::NameRole).toString());
    }
    return names;
}

} // namespace

class ModelScanModelTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();
    void scansAndSortsByAccessTime();
    void exposesRoles();
    void filtersAndSelectsVisibleRows();
    void sortByTogglesDirection();
    void deleteRemovesRowsAndKeepsFailures();
    void deleteWithoutSelectionReports();
    void exportsVisibleRows();
    void exportWithoutRowsReports();
    void changingFolderClearsResults();
    void reportsScanErrors();
    void convertsDialogUrlsToLocalPaths();

private:
    bool scan();

    QTemporaryDir *m_dir = nullptr;
    ModelScanModel *m_model = nullptr;
};

void ModelScanModelTest::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    QVERIFY(writeFile(m_dir->filePath("models/a.safetensors"), 100, dayOne));
    QVERIFY(writeFile(m_dir->filePath("models/sub/b.ckpt"), 250, dayThree));
    QVERIFY(writeFile(m_dir->filePath("models/c.txt"), 10));

    AppSettings settings;
    settings.rootPath = m_dir->path();
    settings.moveToTrash = false;
    m_model = new ModelScanModel(settings);
}

void ModelScanModelTest::cleanup()
{
    delete m_model;
    m_model = nullptr;
    delete m_dir;
    m_dir = nullptr;
}

bool ModelScanModelTest::scan()
{
    QSignalSpy finished(m_model, &ModelScanModel::scanFinished);
    if (!m_model->startScan()) {
        return false;
    }
    if (!finished.wait(10000)) {
        return false;
    }
    return finished.first().first().toMap().value("ok").toBool();
}

void ModelScanModelTest::scansAndSortsByAccessTime()
{
    QSignalSpy operation(m_model, &ModelScanModel::operationChanged);
    QVERIFY(scan());
    QCOMPARE(operation.count(), 2);
    QVERIFY(!m_model->busy());

    QCOMPARE(m_model->totalCount(), 2);
    QCOMPARE(rowNames(*m_model), QStringList({"a.safetensors", "b.ckpt"}));
    QCOMPARE(m_model->sortField(), ModelScanModel::LastAccessTime);
    QCOMPARE(m_model->sortOrder(), Qt::AscendingOrder);
    QCOMPARE(m_model->statusText(), QStringLiteral("Showing 2 files."));
    QCOMPARE(m_model->selectedCount(), 0);
}

void ModelScanModelTest::exposesRoles()
{
    QVERIFY(scan());
    const QModelIndex first = m_model->index(0, 0);
    QCOMPARE(m_model->data(first, ModelScanModel::ExtensionRole).toString(), QStringLiteral(".safetensors"));
    QCOMPARE(m_model->data(first, ModelScanModel::SizeRole).toLongLong(), qint64(100));
    QCOMPARE(m_model->data(first, ModelScanModel::SizeTextRole).toString(), QStringLiteral("100 B"));
    QCOMPARE(m_model->data(first, ModelScanModel::LastAccessTextRole).toString(), QStringLiteral("2024-02-01 10:00:00"));
    QCOMPARE(m_model->data(first, ModelScanModel::SelectedRole).toBool(), false);
    QCOMPARE(m_model->pathForRow(0), QFileInfo(m_dir->filePath("models/a.safetensors")).absoluteFilePath());
    QVERIFY(m_model->pathForRow(5).isEmpty());
    QVERIFY(m_model->roleNames().values().contains("lastAccessText"));
}

void ModelScanModelTest::filtersAndSelectsVisibleRows()
{
    QVERIFY(scan());

    m_model->setFilterText(QStringLiteral("ckpt"));
    QCOMPARE(m_model->rowCount(), 1);
    QCOMPARE(rowNames(*m_model), QStringList({"b.ckpt"}));
    QCOMPARE(m_model->statusText(), QStringLiteral("Showing 1 of 2 files (filtered)."));

    QSignalSpy selection(m_model, &ModelScanModel::selectionChanged);
    m_model->selectAll();
    QCOMPARE(selection.count(), 1);
    const QVariantMap stats = m_model->selectionStats();
    QCOMPARE(stats.value("count").toInt(), 1);
    QCOMPARE(stats.value("bytes").toLongLong(), qint64(250));
    QCOMPARE(m_model->selectionText(), QStringLiteral("Selected: 1 files, 250 B"));

    m_model->setFilterText(QString());
    QCOMPARE(rowNames(*m_model), QStringList({"a.safetensors", "b.ckpt"}));
    QVERIFY(!m_model->isSelected(0));
    QVERIFY(m_model->isSelected(1));

    m_model->toggleSelected(0);
    QCOMPARE(m_model->selectedCount(), 2);
    QCOMPARE(m_model->selectedBytes(), qint64(350));

    m_model->setFilterText(QStringLiteral("safetensors"));
    m_model->selectNone();
    m_model->setFilterText(QString());
    QCOMPARE(m_model->selectedCount(), 1);
    QVERIFY(m_model->isSelected(1));
}

void ModelScanModelTest::sortByTogglesDirection()
{
    QVERIFY(scan());
    QSignalSpy settings(m_model, &ModelScanModel::settingsChanged);

    m_model->sortBy(ModelScanModel::Size);
    QCOMPARE(m_model->sortOrder(), Qt::AscendingOrder);
    QCOMPARE(rowNames(*m_model), QStringList({"a.safetensors", "b.ckpt"}));

    m_model->sortBy(ModelScanModel::Size);
    QCOMPARE(m_model->sortOrder(), Qt::DescendingOrder);
    QCOMPARE(rowNames(*m_model), QStringList({"b.ckpt", "a.safetensors"}));

    QCOMPARE(settings.count(), 2);
    QCOMPARE(m_model->settings().sortField, ModelSort::Size);
    QCOMPARE(m_model->settings().sortOrder, Qt::DescendingOrder);
}

void ModelScanModelTest::deleteRemovesRowsAndKeepsFailures()
{
    QVERIFY(scan());
    m_model->selectAll();
    QCOMPARE(m_model->selectedCount(), 2);

    // vanish behind the scanner's back
    const QString gone = m_model->pathForRow(0);
    QVERIFY(QFile::remove(gone));

    QSignalSpy finished(m_model, &ModelScanModel::deleteFinished);
    QVERIFY(m_model->startDelete());
    QVERIFY(m_model->busy());
    QVERIFY(finished.wait(10000));

    const QVariantMap result = finished.first().first().toMap();
    QCOMPARE(result.value("deleted").toInt(), 1);
    QCOMPARE(result.value("failed").toInt(), 1);
    QCOMPARE(result.value("failures").toList().first().toMap().value("path").toString(), gone);

    QVERIFY(!m_model->busy());
    QCOMPARE(m_model->rowCount(), 1);
    QCOMPARE(m_model->totalCount(), 1);
    QCOMPARE(m_model->pathForRow(0), gone);
    QVERIFY(m_model->isSelected(0));
    QCOMPARE(m_model->selectedCount(), 1);
    QVERIFY(!QFileInfo::exists(m_dir->filePath("models/sub/b.ckpt")));
}

void ModelScanModelTest::deleteWithoutSelectionReports()
{
    QVERIFY(scan());
    QSignalSpy finished(m_model, &ModelScanModel::deleteFinished);
    QVERIFY(!m_model->startDelete());
    QCOMPARE(finished.count(), 1);
    QVERIFY(!finished.first().first().toMap().value("ok").toBool());
    QCOMPARE(m_model->rowCount(), 2);
}

void ModelScanModelTest::exportsVisibleRows()
{
    QVERIFY(scan());
    m_model->setFilterText(QStringLiteral("sub"));

    QSignalSpy finished(m_model, &ModelScanModel::exportFinished);
    QVERIFY(m_model->startExport(m_dir->filePath("report"), false));
    QCOMPARE(m_model->operation(), ModelScanModel::Exporting);
    QVERIFY(finished.wait(10000));

    const QVariantMap result = finished.first().first().toMap();
    QVERIFY2(result.value("ok").toBool(), qPrintable(result.value("error").toString()));
    QCOMPARE(result.value("rows").toInt(), 1);
    QCOMPARE(result.value("path").toString(), m_dir->filePath("report.xlsx"));
    QVERIFY(!result.value("opened").toBool());
    QVERIFY(QFileInfo::exists(m_dir->filePath("report.xlsx")));
    QVERIFY(!m_model->busy());
}

void ModelScanModelTest::exportWithoutRowsReports()
{
    QSignalSpy finished(m_model, &ModelScanModel::exportFinished);
    QVERIFY(!m_model->startExport(m_dir->filePath("empty.xlsx"), false));
    QCOMPARE(finished.count(), 1);
    QVERIFY(!finished.first().first().toMap().value("ok").toBool());
    QVERIFY(!QFileInfo::exists(m_dir->filePath("empty.xlsx")));
}

void ModelScanModelTest::changingFolderClearsResults()
{
    QVERIFY(scan());
    m_model->selectAll();

    m_model->setRootPath(m_dir->path() + QStringLiteral("/"));
    QCOMPARE(m_model->rowCount(), 2);

    QSignalSpy settings(m_model, &ModelScanModel::settingsChanged);
    m_model->setRootPath(m_dir->filePath("models/sub"));
    QCOMPARE(settings.count(), 1);
    QCOMPARE(m_model->rowCount(), 0);
    QCOMPARE(m_model->totalCount(), 0);
    QCOMPARE(m_model->selectedCount(), 0);
    QCOMPARE(m_model->statusText(), QStringLiteral("Ready."));

    QVERIFY(scan());
    QCOMPARE(rowNames(*m_model), QStringList({"b.ckpt"}));
}

void ModelScanModelTest::reportsScanErrors()
{
    m_model->setRootPath(m_dir->filePath("missing"));
    QVERIFY(!m_model->rootPathValid());

    QSignalSpy finished(m_model, &ModelScanModel::scanFinished);
    QVERIFY(m_model->startScan());
    QVERIFY(finished.wait(10000));
    const QVariantMap result = finished.first().first().toMap();
    QVERIFY(!result.value("ok").toBool());
    QVERIFY(!result.value("error").toString().isEmpty());
    QCOMPARE(m_model->rowCount(), 0);
}

void ModelScanModelTest::convertsDialogUrlsToLocalPaths()
{
    const QString spaced = m_dir->filePath("with space/report #1.xlsx");
    QCOMPARE(m_model->localPathFromUrl(QUrl::fromLocalFile(spaced)), spaced);
    QCOMPARE(m_model->localPathFromUrl(QUrl::fromLocalFile(m_dir->path())), m_dir->path());
    QCOMPARE(m_model->localPathFromUrl(QUrl(QStringLiteral("/plain/models"))), QStringLiteral("/plain/models"));
    QVERIFY(m_model->localPathFromUrl(QUrl(QStringLiteral("https://example.com/a.xlsx"))).isEmpty());
    QVERIFY(m_model->localPathFromUrl(QUrl()).isEmpty());
}

QTEST_GUILESS_MAIN(ModelScanModelTest)
#include "tst_modelscanmodel.moc"
