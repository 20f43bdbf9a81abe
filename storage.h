#ifndef STORAGE_H
#define STORAGE_H

#include <QByteArray>
#include <QString>

#include <memory>

class QSettings;

struct StorageError {
    enum Kind {
        NoError,
        OpenError,
        ReadError,
        WriteError,
        SerializationError
    };

    Kind kind = NoError;
    QString message;

    bool isError() const { return kind != NoError; }
};

// Key-value boundary holding opaque values. Each put replaces the whole value
// under its key or fails without touching it.
class Storage {
public:
    virtual ~Storage() = default;

    // *found is false (and the call succeeds) when nothing is stored under key
    virtual bool get(const QString& key, QByteArray* value, bool* found, StorageError* error) = 0;
    virtual bool put(const QString& key, const QByteArray& value, StorageError* error) = 0;
};

// File store on top of QSettings in IniFormat. QSettings commits through
// QSaveFile, so a write lands completely or not at all.
class SettingsStorage : public Storage {
public:
    explicit SettingsStorage(const QString& fileName);
    ~SettingsStorage() override;

    bool open(StorageError* error = nullptr);
    bool isOpen() const { return m_settings != nullptr; }
    QString fileName() const { return m_fileName; }

    bool get(const QString& key, QByteArray* value, bool* found, StorageError* error) override;
    bool put(const QString& key, const QByteArray& value, StorageError* error) override;

private:
    QString m_fileName;
    std::unique_ptr<QSettings> m_settings;
};

#endif // STORAGE_H
