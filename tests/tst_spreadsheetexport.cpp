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
#include <QTemporaryDir>

#include "xlsxcell.h"
#include "xlsxdocument.h"

#include "ResultTable.h"
#include "SpreadsheetExportUtils.h"

namespace {

ModelFileRecord makeRecord(const QString &path, qint64 size, int accessDay)
{
    const QFileInfo info(path);
    ModelFileRecord record;
    record.path = path;
    record.name = info.fileName();
    record.directory = info.path();
    record.extension = QLatin1Char('.') + info.suffix().toLower();
    record.sizeBytes = size;
    record.lastAccessTime = QDateTime(QDate(2024, 5, 1), QTime(8, 30)).addDays(accessDay);
    record.lastWriteTime = record.lastAccessTime;
    record.creationTime = record.lastAccessTime;
    return record;
}

} // namespace

class SpreadsheetExportTest : public QObject
{
    Q_OBJECT

private slots:
    void appendsSuffix_data();
    void appendsSuffix();
    void writesVisibleRowsInOrder();
    void writesHeaderOnlyForEmptyInput();
    void writesAccessTimeAsDate();
    void keepsFormulaLikeNamesLiteral();
    void rejectsMissingFolder();
    void rejectsFolderTarget();

private:
    QTemporaryDir m_dir;
};

void SpreadsheetExportTest::appendsSuffix_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QString>("expected");

    QTest::newRow("missing") << "/tmp/report" << "/tmp/report.xlsx";
    QTest::newRow("present") << "/tmp/report.xlsx" << "/tmp/report.xlsx";
    QTest::newRow("upper") << "/tmp/report.XLSX" << "/tmp/report.XLSX";
    QTest::newRow("other") << "/tmp/report.csv" << "/tmp/report.csv.xlsx";
    QTest::newRow("empty") << "" << "";
}

void SpreadsheetExportTest::appendsSuffix()
{
    QFETCH(QString, input);
    QFETCH(QString, expected);
    QCOMPARE(SpreadsheetExportUtils::ensureXlsxSuffix(input), expected);
}

void SpreadsheetExportTest::writesVisibleRowsInOrder()
{
    QVERIFY(m_dir.isValid());

    ResultTable table;
    table.appendRecords({
        makeRecord("/models/checkpoints/base.safetensors", 4000, 3),
        makeRecord("/models/loras/style.ckpt", 1500, 1),
        makeRecord("/models/loras/extra.ckpt", 2500, 2),
        makeRecord("/models/text/encoder.bin", 900, 0),
    });
    table.setFilter(QStringLiteral("ckpt"));
    table.setSortKey(ModelSort::Size, Qt::DescendingOrder);
    table.setSelected(QStringLiteral("/models/loras/style.ckpt"), true);

    const QString path = m_dir.filePath("export.xlsx");
    QString error;
    QVERIFY2(SpreadsheetExportUtils::writeWorkbook(table.visibleRecords(), path, &error), qPrintable(error));
    QVERIFY(QFileInfo::exists(path));

    QXlsx::Document document(path);
    QVERIFY(document.sheetNames().contains(SpreadsheetExportUtils::sheetName()));
    QVERIFY(document.selectSheet(SpreadsheetExportUtils::sheetName()));

    const QStringList headers = SpreadsheetExportUtils::columnHeaders();
    QCOMPARE(headers, QStringList({"Name", "Path", "Extension", "Size", "Last Access Time", "Selected"}));
    for (int column = 0; column < headers.size(); ++column) {
        QCOMPARE(document.read(1, column + 1).toString(), headers.at(column));
    }

    QCOMPARE(document.read(2, 1).toString(), QStringLiteral("extra.ckpt"));
    QCOMPARE(document.read(2, 2).toString(), QDir::toNativeSeparators("/models/loras/extra.ckpt"));
    QCOMPARE(document.read(2, 3).toString(), QStringLiteral(".ckpt"));
    QCOMPARE(document.read(2, 4).toLongLong(), qlonglong(2500));
    QCOMPARE(document.read(2, 6).toBool(), false);

    QCOMPARE(document.read(3, 1).toString(), QStringLiteral("style.ckpt"));
    QCOMPARE(document.read(3, 4).toLongLong(), qlonglong(1500));
    QCOMPARE(document.read(3, 6).toBool(), true);

    QVERIFY(!document.read(4, 1).isValid() || document.read(4, 1).toString().isEmpty());
}

void SpreadsheetExportTest::writesHeaderOnlyForEmptyInput()
{
    QVERIFY(m_dir.isValid());
    const QString path = m_dir.filePath("empty.xlsx");
    QString error;
    QVERIFY2(SpreadsheetExportUtils::writeWorkbook({}, path, &error), qPrintable(error));

    QXlsx::Document document(path);
    QVERIFY(document.selectSheet(SpreadsheetExportUtils::sheetName()));
    QCOMPARE(document.read(1, 1).toString(), QStringLiteral("Name"));
    QVERIFY(!document.read(2, 1).isValid() || document.read(2, 1).toString().isEmpty());
}

void SpreadsheetExportTest::writesAccessTimeAsDate()
{
    QVERIFY(m_dir.isValid());
    const ModelFileRecord record = makeRecord("/models/vae/decoder.pt", 42, 4);
    const QString path = m_dir.filePath("dates.xlsx");
    QString error;
    QVERIFY2(SpreadsheetExportUtils::writeWorkbook({record}, path, &error), qPrintable(error));

    QXlsx::Document document(path);
    QVERIFY(document.selectSheet(SpreadsheetExportUtils::sheetName()));
    const QVariant value = document.read(2, 5);
    QCOMPARE(value.userType(), int(QMetaType::QDateTime));
    const QDateTime written = value.toDateTime();
    QCOMPARE(written.date(), record.lastAccessTime.date());
    QCOMPARE(written.time().hour(), record.lastAccessTime.time().hour());
    QCOMPARE(written.time().minute(), record.lastAccessTime.time().minute());
    QCOMPARE(written.time().second(), record.lastAccessTime.time().second());
}

void SpreadsheetExportTest::keepsFormulaLikeNamesLiteral()
{
    QVERIFY(m_dir.isValid());
    const ModelFileRecord record = makeRecord("/models/=v2/=v2.safetensors", 7, 0);
    const QString path = m_dir.filePath("literal.xlsx");
    QString error;
    QVERIFY2(SpreadsheetExportUtils::writeWorkbook({record}, path, &error), qPrintable(error));

    QXlsx::Document document(path);
    QVERIFY(document.selectSheet(SpreadsheetExportUtils::sheetName()));
    QCOMPARE(document.read(2, 1).toString(), QStringLiteral("=v2.safetensors"));
    QCOMPARE(document.read(2, 2).toString(), QDir::toNativeSeparators("/models/=v2/=v2.safetensors"));
    QVERIFY(!document.cellAt(2, 1)->hasFormula());
    QVERIFY(!document.cellAt(2, 2)->hasFormula());
}

void SpreadsheetExportTest::rejectsMissingFolder()
{
    QVERIFY(m_dir.isValid());
    const QString path = m_dir.filePath("no/such/folder/out.xlsx");
    QString error;
    QVERIFY(!SpreadsheetExportUtils::writeWorkbook({makeRecord("/m/a.pt", 1, 0)}, path, &error));
    QVERIFY(error.contains(QStringLiteral("Folder not found")));
    QVERIFY(!QFileInfo::exists(path));
}

void SpreadsheetExportTest::rejectsFolderTarget()
{
    QVERIFY(m_dir.isValid());
    const QString path = m_dir.filePath("taken.xlsx");
    QVERIFY(QDir().mkpath(path));
    QString error;
    QVERIFY(!SpreadsheetExportUtils::checkWritable(path, &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!SpreadsheetExportUtils::checkWritable(QString(), &error));
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(SpreadsheetExportTest)
#include "tst_spreadsheetexport.moc"
