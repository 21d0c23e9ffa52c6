#pragma once

#include <QAbstractListModel>
#include <QFutureWatcher>
#include <QVariantMap>
#include <QStringList>
#include <QUrl>

#include "ModelFileRecord.h"
#include "ResultTable.h"
#include "SettingsStore.h"

class QThread;
class ScanWorker;
class TrashWorker;

class ModelScanModel : public QAbstractListModel
{
    Q_OBJECT

    Q_PROPERTY(QString rootPath READ rootPath WRITE setRootPath NOTIFY rootPathChanged)
    Q_PROPERTY(bool rootPathValid READ rootPathValid NOTIFY rootPathChanged)
    Q_PROPERTY(QString filterText READ filterText WRITE setFilterText NOTIFY filterTextChanged)
    Q_PROPERTY(SortField sortField READ sortField WRITE setSortField NOTIFY sortChanged)
    Q_PROPERTY(Qt::SortOrder sortOrder READ sortOrder WRITE setSortOrder NOTIFY sortChanged)
    Q_PROPERTY(bool moveToTrash READ moveToTrash WRITE setMoveToTrash NOTIFY moveToTrashChanged)
    Q_PROPERTY(QString theme READ theme WRITE setTheme NOTIFY themeChanged)
    Q_PROPERTY(Operation operation READ operation NOTIFY operationChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY operationChanged)
    Q_PROPERTY(int progressCompleted READ progressCompleted NOTIFY progressChanged)
    Q_PROPERTY(int progressTotal READ progressTotal NOTIFY progressChanged)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
    Q_PROPERTY(int selectedCount READ selectedCount NOTIFY selectionChanged)
    Q_PROPERTY(qint64 selectedBytes READ selectedBytes NOTIFY selectionChanged)
    Q_PROPERTY(QString selectionText READ selectionText NOTIFY selectionChanged)
    Q_PROPERTY(int totalCount READ totalCount NOTIFY countsChanged)

public:
    enum SortField {
        Name = ModelSort::Name,
        Path = ModelSort::Path,
        Directory = ModelSort::Directory,
        Extension = ModelSort::Extension,
        Size = ModelSort::Size,
        LastAccessTime = ModelSort::LastAccessTime,
        LastWriteTime = ModelSort::LastWriteTime,
        CreationTime = ModelSort::CreationTime
    };
    Q_ENUM(SortField)

    enum Operation {
        Idle = 0,
        Scanning,
        Deleting,
        Exporting
    };
    Q_ENUM(Operation)

    enum Role {
        NameRole = Qt::UserRole + 1,
        PathRole,
        DirectoryRole,
        ExtensionRole,
        SizeRole,
        SizeTextRole,
        LastAccessTimeRole,
        LastAccessTextRole,
        LastWriteTextRole,
        CreationTextRole,
        SelectedRole
    };

    explicit ModelScanModel(const AppSettings &settings, QObject *parent = nullptr);
    ~ModelScanModel() override;

    AppSettings settings() const;

    QString rootPath() const;
    void setRootPath(const QString &path);
    bool rootPathValid() const;

    QString filterText() const;
    void setFilterText(const QString &text);

    SortField sortField() const;
    void setSortField(SortField field);

    Qt::SortOrder sortOrder() const;
    void setSortOrder(Qt::SortOrder order);

    bool moveToTrash() const;
    void setMoveToTrash(bool enabled);

    QString theme() const;
    void setTheme(const QString &theme);

    Operation operation() const;
    bool busy() const;
    int progressCompleted() const;
    int progressTotal() const;
    QString statusText() const;
    int selectedCount() const;
    qint64 selectedBytes() const;
    QString selectionText() const;
    int totalCount() const;

    const ResultTable &table() const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE bool startScan();
    Q_INVOKABLE bool startDelete();
    Q_INVOKABLE bool startExport(const QString &path, bool openAfterExport);
    Q_INVOKABLE void cancelOperation();
    Q_INVOKABLE void sortBy(SortField field);
    Q_INVOKABLE void toggleSelected(int row);
    Q_INVOKABLE void setSelected(int row, bool selected);
    Q_INVOKABLE bool isSelected(int row) const;
    Q_INVOKABLE QString pathForRow(int row) const;
    Q_INVOKABLE void selectAll();
    Q_INVOKABLE void selectNone();
    Q_INVOKABLE QVariantMap selectionStats() const;
    Q_INVOKABLE QString formatBytes(qint64 bytes) const;
    Q_INVOKABLE QString localPathFromUrl(const QUrl &url) const;

signals:
    void rootPathChanged();
    void filterTextChanged();
    void sortChanged();
    void moveToTrashChanged();
    void themeChanged();
    void operationChanged();
    void progressChanged();
    void statusTextChanged();
    void selectionChanged();
    void countsChanged();
    void settingsChanged();

    void scanFinished(QVariantMap result);
    void deleteFinished(QVariantMap result);
    void exportFinished(QVariantMap result);

private:
    void setOperation(Operation operation);
    void updateProgress(int completed, int total);
    void setStatusText(const QString &text);
    void refreshStatusText();
    void appendScannedRecords(const ModelFileRecordList &records);
    void resetRows();
    void applyRowsIncremental(const ModelFileRecordList &rows);
    void syncSelectedRole();
    void notifySelectionChanged();
    void clearResults();

    AppSettings m_settings;
    ResultTable m_table;
    ModelFileRecordList m_rows;

    Operation m_operation = Idle;
    int m_progressCompleted = 0;
    int m_progressTotal = 0;
    QString m_statusText;

    QThread *m_workerThread = nullptr;
    ScanWorker *m_scanWorker = nullptr;
    TrashWorker *m_trashWorker = nullptr;
    QFutureWatcher<QVariantMap> *m_exportWatcher = nullptr;
};
