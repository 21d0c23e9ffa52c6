#pragma once

#include <QString>
#include <QUrl>

namespace PlatformUtils {

QString normalizePath(const QString &path);
QString localPathFromUrl(const QUrl &url);
QString defaultModelsDir();
bool trashAvailable();
bool moveToTrash(const QString &path, QString *error, bool *unsupported = nullptr);
bool deletePermanently(const QString &path, QString *error);
bool openInSpreadsheetApplication(const QString &path);

} // namespace PlatformUtils
