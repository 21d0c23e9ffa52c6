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

#include "SpreadsheetExportUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLocale>
#include <QVector>

#include <algorithm>

#include "xlsxdocument.h"
#include "xlsxformat.h"
#include "xlsxworksheet.h"

#include "FormatUtils.h"
#include "LoggingCategories.h"

namespace {

struct SpreadsheetColumns {
    static constexpr int name = 1;
    static constexpr int path = 2;
    static constexpr int extension = 3;
    static constexpr int size = 4;
    static constexpr int lastAccess = 5;
    static constexpr int selected = 6;
    static constexpr int count = 6;
};

struct SpreadsheetLayout {
    static constexpr int headerRow = 1;
    static constexpr int firstDataRow = 2;
    static constexpr int widthPadding = 2;
    static constexpr int maximumWidth = 80;
};

const char sizeNumberFormat[] = "#,##0";
const char dateNumberFormat[] = "yyyy-mm-dd hh:mm:ss";

void widen(QVector<int> &widths, int column, const QString &text)
{
    widths[column] = std::max(widths.at(column), static_cast<int>(text.size()));
}

} // namespace

namespace SpreadsheetExportUtils {

QStringList columnHeaders()
{
    return {
        QStringLiteral("Name"),
        QStringLiteral("Path"),
        QStringLiteral("Extension"),
        QStringLiteral("Size"),
        QStringLiteral("Last Access Time"),
        QStringLiteral("Selected"),
    };
}

QString sheetName()
{
    return QStringLiteral("Models");
}

QString ensureXlsxSuffix(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty() || trimmed.endsWith(QLatin1String(".xlsx"), Qt::CaseInsensitive)) {
        return trimmed;
    }
    return trimmed + QLatin1String(".xlsx");
}

/**
 * @brief Checks that a spreadsheet can be created or replaced at the given path.
 * @param path Output file path.
 * @param error Optional output error message.
 * @return True when the path looks writable, false otherwise.
 */
bool checkWritable(const QString &path, QString *error)
{
    if (path.trimmed().isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "No output file selected");
        }
        return false;
    }
    const QFileInfo info(path);
    if (info.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "Output path is a folder: %1").arg(path);
        }
        return false;
    }
    const QFileInfo parentInfo(info.absolutePath());
    if (!parentInfo.exists() || !parentInfo.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "Folder not found: %1").arg(info.absolutePath());
        }
        return false;
    }
    if (!parentInfo.isWritable()) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "Folder is not writable: %1").arg(info.absolutePath());
        }
        return false;
    }
    if (info.exists() && !info.isWritable()) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "File is not writable: %1").arg(path);
        }
        return false;
    }
    return true;
}

/**
 * @brief Writes records to an .xlsx workbook, one row per record in the given order.
 * @param records Rows to export, usually the visible rows of the table.
 * @param path Output file path.
 * @param error Optional output error message.
 * @return True when the workbook was saved, false otherwise.
 */
bool writeWorkbook(const ModelFileRecordList &records, const QString &path, QString *error)
{
    if (!checkWritable(path, error)) {
        return false;
    }

    QXlsx::Document document;
    document.addSheet(sheetName());
    document.selectSheet(sheetName());

    QXlsx::Format headerFormat;
    headerFormat.setFontBold(true);
    QXlsx::Format sizeFormat;
    sizeFormat.setNumberFormat(QLatin1String(sizeNumberFormat));
    QXlsx::Format dateFormat;
    dateFormat.setNumberFormat(QLatin1String(dateNumberFormat));

    QVector<int> widths(SpreadsheetColumns::count + 1, 0);
    const QStringList headers = columnHeaders();
    for (int i = 0; i < headers.size(); ++i) {
        document.write(SpreadsheetLayout::headerRow, i + 1, headers.at(i), headerFormat);
        widen(widths, i + 1, headers.at(i));
    }

    // text cells are written as plain strings so names like "=v2.safetensors" never become formulas
    QXlsx::Worksheet *sheet = document.currentWorksheet();
    if (!sheet) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "Failed to create worksheet");
        }
        return false;
    }

    int row = SpreadsheetLayout::firstDataRow;
    for (const ModelFileRecord &record : records) {
        sheet->writeString(row, SpreadsheetColumns::name, record.name);
        sheet->writeString(row, SpreadsheetColumns::path, QDir::toNativeSeparators(record.path));
        sheet->writeString(row, SpreadsheetColumns::extension, record.extension);
        document.write(row, SpreadsheetColumns::size, static_cast<qlonglong>(record.sizeBytes), sizeFormat);
        if (record.lastAccessTime.isValid()) {
            document.write(row, SpreadsheetColumns::lastAccess, record.lastAccessTime.toLocalTime(), dateFormat);
        }
        document.write(row, SpreadsheetColumns::selected, record.selected);

        widen(widths, SpreadsheetColumns::name, record.name);
        widen(widths, SpreadsheetColumns::path, record.path);
        widen(widths, SpreadsheetColumns::extension, record.extension);
        widen(widths, SpreadsheetColumns::size, QLocale::c().toString(record.sizeBytes));
        widen(widths, SpreadsheetColumns::lastAccess, FormatUtils::formatDateTime(record.lastAccessTime));
        widen(widths, SpreadsheetColumns::selected, record.selected ? QStringLiteral("TRUE") : QStringLiteral("FALSE"));
        row += 1;
    }

    for (int column = 1; column <= SpreadsheetColumns::count; ++column) {
        const int width = std::min(widths.at(column) + SpreadsheetLayout::widthPadding, SpreadsheetLayout::maximumWidth);
        document.setColumnWidth(column, static_cast<double>(width));
    }

    if (!document.saveAs(path)) {
        if (error) {
            *error = QCoreApplication::translate("SpreadsheetExportUtils", "Failed to write spreadsheet: %1").arg(path);
        }
        qCWarning(lcExport) << "Could not save workbook" << path;
        return false;
    }
    qCInfo(lcExport) << "Exported" << records.size() << "rows to" << path;
    return true;
}

} // namespace SpreadsheetExportUtils
