#include "tempo/temporal/TaskExtractor.hpp"

#include <QRegularExpression>

namespace tempo {
namespace temporal {

namespace {
constexpr int MIN_MEANINGFUL_LENGTH = 3;

const std::vector<QRegularExpression> &temporalPhrases()
{
    static const std::vector<QRegularExpression> phrases = {
        QRegularExpression(QStringLiteral("\\b(tomorrow|today|tonight|right now|now|currently)\\b"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\b(next|this|last)\\s+(week|month|year|monday|tuesday|wednesday|thursday|"
                                          "friday|saturday|sunday)\\b"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\b(in|at|on|for)\\s+\\d+(:\\d{2})?\\s*(am|pm|hours?|minutes?|days?|weeks?)?\\b"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\b(?:this\\s+)?(morning|afternoon|evening|night)\\b"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\b\\d{1,2}(:\\d{2})?\\s*(am|pm)\\b"), QRegularExpression::CaseInsensitiveOption),
    };
    return phrases;
}
} // namespace

TaskExtractor::TaskExtractor()
    : m_keywords(defaultKeywords())
{
}

TaskExtractor::TaskExtractor(KeywordList keywords)
    : m_keywords(std::move(keywords))
{
}

TaskExtractor::KeywordList TaskExtractor::defaultKeywords()
{
    return {
        { QStringLiteral("Exam"), { "exam", "test", "quiz", "midterm", "final" } },
        { QStringLiteral("Study"), { "study", "review", "homework", "assignment", "reading" } },
        { QStringLiteral("Gym"), { "gym", "workout", "exercise", "fitness", "training", "run", "jog" } },
        { QStringLiteral("Social"),
          { "meet", "meeting", "hangout", "party", "dinner", "lunch", "coffee", "friend", "sleep", "rest", "nap",
            "bedtime", "wake", "call" } },
        { QStringLiteral("Gaming"), { "game", "gaming", "play", "stream", "esports" } },
    };
}

std::optional<QString> TaskExtractor::extractCategory(const QString &text) const
{
    for (const auto &entry : m_keywords) {
        for (const QString &keyword : entry.second) {
            const QRegularExpression word(QStringLiteral("\\b%1\\b").arg(QRegularExpression::escape(keyword)),
                                          QRegularExpression::CaseInsensitiveOption);
            if (word.match(text).hasMatch()) {
                return entry.first;
            }
        }
    }
    return std::nullopt;
}

QString TaskExtractor::extractTitle(const QString &text) const
{
    QString cleaned = text;
    for (const auto &phrase : temporalPhrases()) {
        cleaned.remove(phrase);
    }

    static const QRegularExpression leadingVerb(QStringLiteral("^\\s*(schedule|add|create|make|set up|book)\\s+"),
                                                QRegularExpression::CaseInsensitiveOption);
    cleaned.remove(leadingVerb);
    cleaned = cleaned.simplified();

    if (cleaned.isEmpty()) {
        return text.trimmed();
    }
    return cleaned;
}

bool TaskExtractor::isAmbiguous(const QString &text) const
{
    if (text.trimmed().size() < MIN_MEANINGFUL_LENGTH) {
        return true;
    }
    return !extractCategory(text) && extractTitle(text).size() < MIN_MEANINGFUL_LENGTH;
}

} // namespace temporal
} // namespace tempo
