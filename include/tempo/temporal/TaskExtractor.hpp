#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <utility>
#include <vector>

namespace tempo {
namespace temporal {

// Keyword based category detection and title cleanup for free text requests.
class TaskExtractor
{
public:
    using KeywordList = std::vector<std::pair<QString, QStringList>>;

    TaskExtractor();
    explicit TaskExtractor(KeywordList keywords);

    static KeywordList defaultKeywords();

    std::optional<QString> extractCategory(const QString &text) const;
    QString extractTitle(const QString &text) const;
    bool isAmbiguous(const QString &text) const;

private:
    KeywordList m_keywords;
};

} // namespace temporal
} // namespace tempo
