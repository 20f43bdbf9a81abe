#include "storage.h"
#include "logging.h"

#include <QFileInfo>
#include <QSettings>

static bool fail(StorageError* error, StorageError::Kind kind, const QString& message)
{
    qCWarning(lcStore).noquote() << message;
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

static QString statusText(QSettings::Status status)
{
    switch (status) {
    case QSettings::AccessError: return QStringLiteral("access error");
    case QSettings::FormatError: return QStringLiteral("file is not a valid store");
    case QSettings::NoError: break;
    }
    return QStringLiteral("no error");
}

SettingsStorage::SettingsStorage(const QString& fileName)
    : m_fileName(fileName)
{
}

SettingsStorage::~SettingsStorage() = default;

bool SettingsStorage::open(StorageError* error)
{
    const QFileInfo info(m_fileName);
    if (!QFileInfo(info.absolutePath()).isDir())
        return fail(error, StorageError::OpenError,
                    QStringLiteral("could not open db %1: directory does not exist").arg(m_fileName));
    if (info.exists() && (!info.isFile() || !info.isReadable()))
        return fail(error, StorageError::OpenError,
                    QStringLiteral("could not open db %1: file is not readable").arg(m_fileName));

    std::unique_ptr<QSettings> settings(new QSettings(m_fileName, QSettings::IniFormat));
    if (settings->status() != QSettings::NoError)
        return fail(error, StorageError::OpenError,
                    QStringLiteral("could not open db %1: %2").arg(m_fileName, statusText(settings->status())));

    m_settings = std::move(settings);
    qCDebug(lcStore) << "Opened store" << m_fileName;
    return true;
}

bool SettingsStorage::get(const QString& key, QByteArray* value, bool* found, StorageError* error)
{
    if (!m_settings)
        return fail(error, StorageError::ReadError, QStringLiteral("db %1 is not open").arg(m_fileName));

    const QVariant stored = m_settings->value(key);
    if (found) *found = stored.isValid();
    if (value) *value = stored.isValid() ? stored.toByteArray() : QByteArray();
    return true;
}

bool SettingsStorage::put(const QString& key, const QByteArray& value, StorageError* error)
{
    if (!m_settings)
        return fail(error, StorageError::WriteError, QStringLiteral("db %1 is not open").arg(m_fileName));
    if (!m_settings->isWritable())
        return fail(error, StorageError::WriteError,
                    QStringLiteral("could not set %1: %2 is read-only").arg(key, m_fileName));

    m_settings->setValue(key, value);
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError)
        return fail(error, StorageError::WriteError,
                    QStringLiteral("could not set %1: %2").arg(key, statusText(m_settings->status())));

    qCDebug(lcStore) << "Wrote" << value.size() << "bytes under" << key;
    return true;
}
