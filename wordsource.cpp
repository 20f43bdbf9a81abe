#include "wordsource.h"
#include "logging.h"
#include "player.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QTextStream>

#include <algorithm>

static void initWordResources()
{
    // words.qrc is compiled into the static core library
    Q_INIT_RESOURCE(words);
}

std::string parse_word(const QString& line)
{
  const QString raw = line.trimmed().toLower();
  if (raw.isEmpty() || raw.startsWith(QLatin1Char('#'))) return "";
  if (raw.size() != WORD_LENGTH) return "";

  std::string clean;
  clean.reserve(WORD_LENGTH);
  for (QChar c : raw) {
    const char16_t u = c.unicode();
    if (u < u'a' || u > u'z') return "";
    clean += static_cast<char>(u);
  }
  return clean;
}

static bool read_word_list(const QString& path, std::vector<std::string>& out, QString* errorString)
{
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    if (errorString)
      *errorString = QStringLiteral("could not open word list %1: %2").arg(path, file.errorString());
    return false;
  }

  QTextStream in(&file);
  QString line;
  int skipped = 0;
  while (in.readLineInto(&line)) {
    std::string w = parse_word(line);
    if (!w.empty()) {
      out.push_back(std::move(w));
    } else if (!line.trimmed().isEmpty() && !line.trimmed().startsWith(QLatin1Char('#'))) {
      ++skipped;
    }
  }
  if (skipped > 0)
    qCDebug(lcWords) << "Skipped" << skipped << "malformed entries in" << path;
  return true;
}

DictionaryWordSource::DictionaryWordSource()
  : rng(QRandomGenerator::global()->generate())
{
}

bool DictionaryWordSource::load_default(QString* errorString)
{
  initWordResources();
  return load_database(QStringLiteral(":/words/answers.txt"),
                       QStringLiteral(":/words/allowed.txt"), errorString);
}

bool DictionaryWordSource::load_directory(const QString& dir, QString* errorString)
{
  const QDir d(dir);
  return load_database(d.filePath(QStringLiteral("answers.txt")),
                       d.filePath(QStringLiteral("allowed.txt")), errorString);
}

bool DictionaryWordSource::load_database(const QString& answersFile, const QString& allowedFile,
                                         QString* errorString)
{
  QElapsedTimer timer;
  timer.start();

  answers.clear();
  guesses.clear();

  if (!read_word_list(answersFile, answers, errorString)) return false;
  if (answers.empty()) {
    if (errorString)
      *errorString = QStringLiteral("word list %1 has no usable answers").arg(answersFile);
    return false;
  }

  std::sort(answers.begin(), answers.end());
  answers.erase(std::unique(answers.begin(), answers.end()), answers.end());

  std::vector<std::string> allowed;
  if (!read_word_list(allowedFile, allowed, errorString)) return false;

  guesses.reserve(answers.size() + allowed.size());
  guesses.insert(answers.begin(), answers.end());
  guesses.insert(allowed.begin(), allowed.end());

  qCInfo(lcWords) << "Loaded" << answers.size() << "answers and" << guesses.size()
                  << "accepted guesses in" << timer.elapsed() << "ms";
  return true;
}

std::string DictionaryWordSource::getRandomAnswer()
{
  if (answers.empty()) return "";

  const int index = static_cast<int>(rng.bounded(static_cast<quint32>(answers.size())));
  return answers[index];
}

bool DictionaryWordSource::is_valid_guess(const std::string& word) const
{
  if (word.size() != static_cast<size_t>(WORD_LENGTH)) return false;
  return guesses.count(word) > 0;
}
