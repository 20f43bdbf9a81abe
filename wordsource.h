#ifndef WORDSOURCE_H
#define WORDSOURCE_H

#include <QRandomGenerator>
#include <QString>

#include <string>
#include <unordered_set>
#include <vector>

// Supplies the secret answer and decides which guesses are acceptable.
class WordSource {
public:
    virtual ~WordSource() = default;

    // Returns an empty string when no answer can be produced
    virtual std::string getRandomAnswer() = 0;
    virtual bool is_valid_guess(const std::string& word) const = 0;
};

// Word source backed by two word lists: answers that can be drawn, and extra
// words that are only accepted as guesses. The default lists ship as Qt
// resources; a directory holding answers.txt and allowed.txt replaces them.
class DictionaryWordSource : public WordSource {
public:
    DictionaryWordSource();

    bool load_default(QString* errorString = nullptr);
    bool load_directory(const QString& dir, QString* errorString = nullptr);
    bool load_database(const QString& answersFile, const QString& allowedFile,
                       QString* errorString = nullptr);

    void setSeed(quint32 seed) { rng.seed(seed); }

    std::string getRandomAnswer() override;
    bool is_valid_guess(const std::string& word) const override;

    int answerCount() const { return static_cast<int>(answers.size()); }
    int guessCount() const { return static_cast<int>(guesses.size()); }

private:
    std::vector<std::string> answers;
    std::unordered_set<std::string> guesses;
    QRandomGenerator rng;
};

// Lowercases and checks for exactly WORD_LENGTH ASCII letters. Returns an
// empty string for comment lines and anything that is not a word.
std::string parse_word(const QString& line);

#endif // WORDSOURCE_H
