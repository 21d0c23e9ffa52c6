#pragma once

#include <QString>
#include <QStringList>

#include "ModelFileRecord.h"

namespace SpreadsheetExportUtils {

QStringList columnHeaders();
QString sheetName();
QString ensureXlsxSuffix(const QString &path);
bool checkWritable(const QString &path, QString *error);
bool writeWorkbook(const ModelFileRecordList &records, const QString &path, QString *error);

} // namespace SpreadsheetExportUtils
