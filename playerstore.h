#ifndef PLAYERSTORE_H
#define PLAYERSTORE_H

#include "player.h"
#include "storage.h"

#include <QByteArray>
#include <QString>

// Reads and writes the player profile as a JSON object under one fixed key.
//
// Wire format (field names kept from earlier releases):
//   {"played": 3, "won": 2, "currStreak": 1, "longestStreak": 2,
//    "stats": [0, 1, 1, 0, 0, 0], "hiContrast": false, "hardMode": false}
//
// Counters are JSON numbers. Older files wrote them as floats; any finite,
// non-negative integral value is accepted on read.
class PlayerStore {
public:
    static const QString Key;

    explicit PlayerStore(Storage& storage);

    // An empty store yields the zero-valued default player
    bool load(Player* player, StorageError* error = nullptr) const;
    bool save(const Player& player, StorageError* error = nullptr);

    static QByteArray toJson(const Player& player);
    static bool fromJson(const QByteArray& json, Player* player, QString* errorString = nullptr);

private:
    Storage& m_storage;
};

#endif // PLAYERSTORE_H
