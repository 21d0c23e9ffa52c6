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

#include "SettingsStore.h"

#include <QSettings>

#include "LoggingCategories.h"
#include "PlatformUtils.h"

namespace {
constexpr char organizationName[] = "Modelman";
constexpr char applicationName[] = "Modelman";
constexpr char folderKey[] = "folder";
constexpr char themeKey[] = "theme";
constexpr char sortFieldKey[] = "sortField";
constexpr char sortAscendingKey[] = "sortAscending";
constexpr char moveToTrashKey[] = "moveToTrash";

const QString lightTheme = QStringLiteral("Light");
const QString darkTheme = QStringLiteral("Dark");
} // namespace

namespace SettingsStore {

AppSettings defaults()
{
    AppSettings settings;
    settings.rootPath = PlatformUtils::defaultModelsDir();
    return settings;
}

AppSettings load()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope,
                       QLatin1String(organizationName), QLatin1String(applicationName));
    return loadFrom(settings);
}

/**
 * @brief Reads settings, replacing unknown or out-of-range values with defaults.
 * @param settings Store to read from.
 * @return Loaded settings.
 */
AppSettings loadFrom(QSettings &settings)
{
    AppSettings result = defaults();

    const QString folder = settings.value(QLatin1String(folderKey)).toString().trimmed();
    if (!folder.isEmpty()) {
        result.rootPath = folder;
    }

    const QString theme = settings.value(QLatin1String(themeKey), lightTheme).toString();
    result.theme = (theme == darkTheme) ? darkTheme : lightTheme;

    bool fieldOk = false;
    const int field = settings.value(QLatin1String(sortFieldKey), static_cast<int>(result.sortField)).toInt(&fieldOk);
    if (fieldOk && field >= ModelSort::firstField && field <= ModelSort::lastField) {
        result.sortField = static_cast<ModelSort::Field>(field);
    } else {
        qCWarning(lcSettings) << "Ignoring stored sort field" << settings.value(QLatin1String(sortFieldKey));
    }

    const bool ascending = settings.value(QLatin1String(sortAscendingKey), true).toBool();
    result.sortOrder = ascending ? Qt::AscendingOrder : Qt::DescendingOrder;

    result.moveToTrash = settings.value(QLatin1String(moveToTrashKey), true).toBool();
    return result;
}

void save(const AppSettings &settings)
{
    QSettings store(QSettings::IniFormat, QSettings::UserScope,
                    QLatin1String(organizationName), QLatin1String(applicationName));
    saveTo(store, settings);
}

void saveTo(QSettings &store, const AppSettings &settings)
{
    store.setValue(QLatin1String(folderKey), settings.rootPath);
    store.setValue(QLatin1String(themeKey), settings.theme);
    store.setValue(QLatin1String(sortFieldKey), static_cast<int>(settings.sortField));
    store.setValue(QLatin1String(sortAscendingKey), settings.sortOrder == Qt::AscendingOrder);
    store.setValue(QLatin1String(moveToTrashKey), settings.moveToTrash);
    store.sync();
    if (store.status() != QSettings::NoError) {
        qCWarning(lcSettings) << "Could not write settings to" << store.fileName();
    }
}

} // namespace SettingsStore
