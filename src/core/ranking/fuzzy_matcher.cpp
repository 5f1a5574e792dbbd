#include "core/ranking/fuzzy_matcher.h"

#include <QChar>

#include <algorithm>
#include <climits>

namespace vanta {

namespace {

constexpr int kNoScore = INT_MIN / 2;

std::vector<char32_t> codePoints(const QString& text)
{
    const QList<uint> ucs4 = text.toUcs4();
    return std::vector<char32_t>(ucs4.begin(), ucs4.end());
}

} // namespace

FuzzyMatcher::FuzzyMatcher(const QString& pattern)
{
    const std::vector<char32_t> raw = codePoints(pattern);
    for (char32_t c : raw) {
        if (QChar::isUpper(c)) {
            m_caseSensitive = true;
        }
        if (c > 0x7f) {
            m_normalize = false;
        }
    }
    m_needle.reserve(raw.size());
    for (char32_t c : raw) {
        m_needle.push_back(fold(c));
    }
}

std::optional<FuzzyMatch> FuzzyMatcher::match(const QString& haystack) const
{
    if (m_needle.empty()) {
        return std::nullopt;
    }

    const std::vector<char32_t> original = codePoints(haystack);
    const int n = static_cast<int>(original.size());
    const int m = static_cast<int>(m_needle.size());
    if (m > n) {
        return std::nullopt;
    }

    std::vector<char32_t> folded(original.size());
    std::vector<int> bonus(original.size());
    CharClass prevClass = CharClass::Whitespace;
    for (int j = 0; j < n; ++j) {
        folded[j] = fold(original[j]);
        const CharClass cls = classify(original[j]);
        bonus[j] = bonusFor(prevClass, cls);
        prevClass = cls;
    }

    // Cheap subsequence check before the quadratic pass.
    int cursor = 0;
    for (int j = 0; j < n && cursor < m; ++j) {
        if (folded[j] == m_needle[cursor]) {
            ++cursor;
        }
    }
    if (cursor < m) {
        return std::nullopt;
    }

    const auto at = [n](int i, int j) { return static_cast<size_t>(i) * n + j; };
    std::vector<int> score(static_cast<size_t>(m) * n, kNoScore);
    std::vector<int> runBonus(static_cast<size_t>(m) * n, 0);
    std::vector<int> from(static_cast<size_t>(m) * n, -1);

    for (int j = 0; j < n; ++j) {
        if (folded[j] == m_needle[0]) {
            score[at(0, j)] = kScoreMatch + bonus[j] * kBonusFirstCharMultiplier;
            runBonus[at(0, j)] = bonus[j];
        }
    }

    for (int i = 1; i < m; ++i) {
        int gapBest = kNoScore;
        int gapFrom = -1;
        for (int j = i; j < n; ++j) {
            if (gapBest > kNoScore) {
                gapBest -= kPenaltyGapExtension;
            }
            if (j >= 2) {
                const int prev = score[at(i - 1, j - 2)];
                if (prev > kNoScore && prev - kPenaltyGapStart >= gapBest) {
                    gapBest = prev - kPenaltyGapStart;
                    gapFrom = j - 2;
                }
            }

            if (folded[j] != m_needle[i]) {
                continue;
            }

            int best = kNoScore;
            const int diagonal = score[at(i - 1, j - 1)];
            if (diagonal > kNoScore) {
                int run = std::max(runBonus[at(i - 1, j - 1)], kBonusConsecutive);
                if (bonus[j] >= kBonusBoundary && bonus[j] > run) {
                    run = bonus[j];
                }
                best = diagonal + kScoreMatch + std::max(run, bonus[j]);
                runBonus[at(i, j)] = run;
                from[at(i, j)] = j - 1;
            }
            if (gapBest > kNoScore) {
                const int gapped = gapBest + kScoreMatch + bonus[j];
                if (gapped > best) {
                    best = gapped;
                    runBonus[at(i, j)] = bonus[j];
                    from[at(i, j)] = gapFrom;
                }
            }
            score[at(i, j)] = best;
        }
    }

    int bestScore = kNoScore;
    int bestEnd = -1;
    for (int j = m - 1; j < n; ++j) {
        if (score[at(m - 1, j)] > bestScore) {
            bestScore = score[at(m - 1, j)];
            bestEnd = j;
        }
    }
    if (bestEnd < 0) {
        return std::nullopt;
    }

    FuzzyMatch result;
    result.score = static_cast<uint32_t>(std::max(bestScore, 0));
    result.indices.resize(m);
    int j = bestEnd;
    for (int i = m - 1; i >= 0; --i) {
        result.indices[i] = static_cast<uint32_t>(j);
        j = from[at(i, j)];
    }
    return result;
}

FuzzyMatcher::CharClass FuzzyMatcher::classify(char32_t c)
{
    if (QChar::isSpace(c)) {
        return CharClass::Whitespace;
    }
    switch (c) {
    case U'/':
    case U',':
    case U':':
    case U';':
    case U'|':
        return CharClass::Delimiter;
    default:
        break;
    }
    if (QChar::isLower(c)) {
        return CharClass::Lower;
    }
    if (QChar::isUpper(c)) {
        return CharClass::Upper;
    }
    if (QChar::isDigit(c)) {
        return CharClass::Number;
    }
    if (QChar::isLetter(c)) {
        return CharClass::Letter;
    }
    return CharClass::NonWord;
}

int FuzzyMatcher::bonusFor(CharClass prev, CharClass current)
{
    const bool currentIsWord = current == CharClass::Lower || current == CharClass::Upper
        || current == CharClass::Letter || current == CharClass::Number;
    if (currentIsWord) {
        switch (prev) {
        case CharClass::Whitespace:
            return kBonusBoundaryWhite;
        case CharClass::Delimiter:
            return kBonusBoundaryDelimiter;
        case CharClass::NonWord:
            return kBonusBoundary;
        default:
            break;
        }
    }
    if ((prev == CharClass::Lower && current == CharClass::Upper)
        || (prev != CharClass::Number && current == CharClass::Number)) {
        return kBonusCamel123;
    }
    if (current == CharClass::Whitespace) {
        return kBonusBoundaryWhite;
    }
    if (current == CharClass::NonWord || current == CharClass::Delimiter) {
        return kBonusNonWord;
    }
    return 0;
}

char32_t FuzzyMatcher::fold(char32_t c) const
{
    if (m_normalize && c > 0x7f) {
        const QString decomposed = QChar::decomposition(c);
        if (!decomposed.isEmpty()) {
            const QList<uint> base = decomposed.toUcs4();
            if (!base.isEmpty() && QChar::isLetterOrNumber(base.first())) {
                c = base.first();
            }
        }
    }
    if (!m_caseSensitive) {
        c = QChar::toLower(c);
    }
    return c;
}

} // namespace vanta
