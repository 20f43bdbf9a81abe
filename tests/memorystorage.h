#ifndef MEMORYSTORAGE_H
#define MEMORYSTORAGE_H

#include "storage.h"

#include <QDebug>
#include <QHash>

// In-process store with switches for failing reads and writes
class MemoryStorage : public Storage {
public:
    bool get(const QString& key, QByteArray* value, bool* found, StorageError* error) override
    {
        if (!m_failReads.isEmpty())
            return fail(error, StorageError::ReadError, m_failReads);

        const auto it = m_values.constFind(key);
        if (found) *found = it != m_values.constEnd();
        if (value) *value = it != m_values.constEnd() ? *it : QByteArray();
        return true;
    }

    bool put(const QString& key, const QByteArray& value, StorageError* error) override
    {
        if (!m_failNextWrite.isEmpty()) {
            const QString message = m_failNextWrite;
            m_failNextWrite.clear();
            return fail(error, StorageError::WriteError, message);
        }
        m_values.insert(key, value);
        ++m_writes;
        return true;
    }

    // The next put fails with the given message and leaves the value as it was
    void failNextWrite(const QString& message) { m_failNextWrite = message; }
    void failReads(const QString& message) { m_failReads = message; }

    bool contains(const QString& key) const { return m_values.contains(key); }
    QByteArray value(const QString& key) const { return m_values.value(key); }
    int writeCount() const { return m_writes; }

private:
    // warns like SettingsStorage does
    static bool fail(StorageError* error, StorageError::Kind kind, const QString& message)
    {
        qWarning().noquote() << message;
        if (error) {
            error->kind = kind;
            error->message = message;
        }
        return false;
    }

    QHash<QString, QByteArray> m_values;
    QString m_failNextWrite;
    QString m_failReads;
    int m_writes = 0;
};

#endif // MEMORYSTORAGE_H
