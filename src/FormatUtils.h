#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace FormatUtils {

QString formatBytes(qint64 bytes);
QString formatDateTime(const QDateTime &dateTime);

} // namespace FormatUtils
