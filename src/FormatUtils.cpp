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

#include "FormatUtils.h"

namespace FormatUtils {

namespace {
constexpr double unitStep = 1024.0;
const char dateTimePattern[] = "yyyy-MM-dd HH:mm:ss";
} // namespace

/**
 * @brief Formats a byte count with a binary unit suffix.
 * @param bytes Byte count to format.
 * @return Text such as "512 B", "1.5 MB" or "2.25 GB".
 */
QString formatBytes(qint64 bytes)
{
    if (bytes < 0) {
        bytes = 0;
    }
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    const double kb = static_cast<double>(bytes) / unitStep;
    if (kb < unitStep) {
        return QStringLiteral("%1 KB").arg(kb, 0, 'f', 1);
    }
    const double mb = kb / unitStep;
    if (mb < unitStep) {
        return QStringLiteral("%1 MB").arg(mb, 0, 'f', 1);
    }
    const double gb = mb / unitStep;
    if (gb < unitStep) {
        return QStringLiteral("%1 GB").arg(gb, 0, 'f', 2);
    }
    return QStringLiteral("%1 TB").arg(gb / unitStep, 0, 'f', 2);
}

QString formatDateTime(const QDateTime &dateTime)
{
    if (!dateTime.isValid()) {
        return QString();
    }
    return dateTime.toLocalTime().toString(QLatin1String(dateTimePattern));
}

} // namespace FormatUtils
