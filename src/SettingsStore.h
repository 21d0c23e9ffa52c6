#pragma once

#include <QString>

#include "ModelFileRecord.h"

class QSettings;

struct AppSettings {
    QString rootPath;
    QString theme = QStringLiteral("Light");
    ModelSort::Field sortField = ModelSort::LastAccessTime;
    Qt::SortOrder sortOrder = Qt::AscendingOrder;
    bool moveToTrash = true;
};

namespace SettingsStore {

AppSettings defaults();
AppSettings load();
AppSettings loadFrom(QSettings &settings);
void save(const AppSettings &settings);
void saveTo(QSettings &store, const AppSettings &settings);

} // namespace SettingsStore
