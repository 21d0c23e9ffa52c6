#pragma once

#include <QSet>
#include <QString>

namespace ModelExtensionUtils {

const QSet<QString> &supportedExtensions();
QString normalizedExtension(const QString &fileName);
bool isModelFileName(const QString &fileName);

} // namespace ModelExtensionUtils
