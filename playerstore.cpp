#include "playerstore.h"
#include "logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <climits>
#include <cmath>

const QString PlayerStore::Key = QStringLiteral("DB/PLAYER");

static bool setError(QString* errorString, const QString& message)
{
    if (errorString) *errorString = message;
    return false;
}

static bool readCount(const QJsonValue& value, const QString& name, int* out, QString* errorString)
{
    if (value.isUndefined()) {
        *out = 0;
        return true;
    }
    if (!value.isDouble())
        return setError(errorString, QStringLiteral("field %1 is not a number").arg(name));

    const double d = value.toDouble();
    if (!std::isfinite(d) || d < 0 || d != std::floor(d) || d > INT_MAX)
        return setError(errorString, QStringLiteral("field %1 must be a non-negative integer").arg(name));

    *out = static_cast<int>(d);
    return true;
}

static bool readFlag(const QJsonValue& value, const QString& name, bool* out, QString* errorString)
{
    if (value.isUndefined()) {
        *out = false;
        return true;
    }
    if (!value.isBool())
        return setError(errorString, QStringLiteral("field %1 is not a boolean").arg(name));
    *out = value.toBool();
    return true;
}

PlayerStore::PlayerStore(Storage& storage)
    : m_storage(storage)
{
}

QByteArray PlayerStore::toJson(const Player& player)
{
    QJsonArray stats;
    for (int count : player.guessDistribution)
        stats.append(count);

    QJsonObject obj;
    obj.insert(QStringLiteral("played"), player.gamesPlayed);
    obj.insert(QStringLiteral("won"), player.gamesWon);
    obj.insert(QStringLiteral("currStreak"), player.currentStreak);
    obj.insert(QStringLiteral("longestStreak"), player.longestStreak);
    obj.insert(QStringLiteral("stats"), stats);
    obj.insert(QStringLiteral("hiContrast"), player.highContrast);
    obj.insert(QStringLiteral("hardMode"), player.hardMode);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool PlayerStore::fromJson(const QByteArray& json, Player* player, QString* errorString)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return setError(errorString, QStringLiteral("could not parse player data json: %1").arg(parseError.errorString()));
    if (!doc.isObject())
        return setError(errorString, QStringLiteral("player data is not a json object"));

    const QJsonObject obj = doc.object();
    Player p;
    if (!readCount(obj.value(QStringLiteral("played")), QStringLiteral("played"), &p.gamesPlayed, errorString)
        || !readCount(obj.value(QStringLiteral("won")), QStringLiteral("won"), &p.gamesWon, errorString)
        || !readCount(obj.value(QStringLiteral("currStreak")), QStringLiteral("currStreak"), &p.currentStreak, errorString)
        || !readCount(obj.value(QStringLiteral("longestStreak")), QStringLiteral("longestStreak"), &p.longestStreak, errorString)
        || !readFlag(obj.value(QStringLiteral("hiContrast")), QStringLiteral("hiContrast"), &p.highContrast, errorString)
        || !readFlag(obj.value(QStringLiteral("hardMode")), QStringLiteral("hardMode"), &p.hardMode, errorString))
        return false;

    const QJsonValue stats = obj.value(QStringLiteral("stats"));
    if (!stats.isUndefined()) {
        if (!stats.isArray())
            return setError(errorString, QStringLiteral("field stats is not an array"));
        const QJsonArray array = stats.toArray();
        if (array.size() != MAX_GUESSES)
            return setError(errorString, QStringLiteral("field stats has %1 entries, expected %2")
                                             .arg(array.size()).arg(MAX_GUESSES));
        for (int i = 0; i < MAX_GUESSES; ++i) {
            if (!readCount(array.at(i), QStringLiteral("stats[%1]").arg(i), &p.guessDistribution[i], errorString))
                return false;
        }
    }

    if (!p.isConsistent())
        return setError(errorString, QStringLiteral("player data is inconsistent (won %1 of %2 played)")
                                         .arg(p.gamesWon).arg(p.gamesPlayed));

    *player = p;
    return true;
}

bool PlayerStore::load(Player* player, StorageError* error) const
{
    QByteArray bytes;
    bool found = false;
    if (!m_storage.get(Key, &bytes, &found, error))
        return false;

    if (!found) {
        qCInfo(lcStore) << "No stored player, starting from defaults";
        *player = Player();
        return true;
    }

    QString message;
    if (!fromJson(bytes, player, &message)) {
        qCWarning(lcStore).noquote() << message;
        if (error) {
            error->kind = StorageError::SerializationError;
            error->message = message;
        }
        return false;
    }

    qCDebug(lcStore) << "Loaded player with" << player->gamesPlayed << "games played";
    return true;
}

bool PlayerStore::save(const Player& player, StorageError* error)
{
    if (!player.isConsistent()) {
        const QString message = QStringLiteral("refusing to save inconsistent player data");
        qCWarning(lcStore).noquote() << message;
        if (error) {
            error->kind = StorageError::SerializationError;
            error->message = message;
        }
        return false;
    }
    return m_storage.put(Key, toJson(player), error);
}
