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

#include "ModelExtensionUtils.h"

namespace ModelExtensionUtils {

/**
 * @brief Returns the set of recognized model file extensions.
 * @return Set of lowercase extensions, each with a leading dot.
 */
const QSet<QString> &supportedExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral(".safetensors"),
        QStringLiteral(".ckpt"),
        QStringLiteral(".pth"),
        QStringLiteral(".pt"),
        QStringLiteral(".onnx"),
        QStringLiteral(".bin"),
        QStringLiteral(".gguf"),
    };
    return extensions;
}

/**
 * @brief Extracts the lowercase suffix after the last dot of a file name.
 * @param fileName File name or path to inspect.
 * @return Suffix with a leading dot, or an empty string when there is none.
 */
QString normalizedExtension(const QString &fileName)
{
    const int slash = qMax(fileName.lastIndexOf(QLatin1Char('/')), fileName.lastIndexOf(QLatin1Char('\\')));
    const int dot = fileName.lastIndexOf(QLatin1Char('.'));
    if (dot <= slash + 1 || dot == fileName.size() - 1) {
        return QString();
    }
    return fileName.mid(dot).toLower();
}

bool isModelFileName(const QString &fileName)
{
    const QString extension = normalizedExtension(fileName);
    if (extension.isEmpty()) {
        return false;
    }
    return supportedExtensions().contains(extension);
}

} // namespace ModelExtensionUtils
