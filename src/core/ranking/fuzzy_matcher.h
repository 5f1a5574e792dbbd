#pragma once

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace vanta {

struct FuzzyMatch {
    uint32_t score = 0;
    std::vector<uint32_t> indices;   // code point positions in the haystack
};

// Subsequence fuzzy matcher with boundary, camel-case and consecutive
// bonuses (fzf/nucleo scoring model). Finds the best-scoring alignment.
//
// Case is smart: matching is case-insensitive unless the pattern contains an
// uppercase letter. Normalization is smart: haystack letters are folded to
// their base letter ("é" matches "e") unless the pattern itself contains
// non-ASCII characters.
class FuzzyMatcher {
public:
    static constexpr int kScoreMatch = 16;
    static constexpr int kPenaltyGapStart = 3;
    static constexpr int kPenaltyGapExtension = 1;
    static constexpr int kBonusBoundary = kScoreMatch / 2;
    static constexpr int kBonusBoundaryWhite = kBonusBoundary + 2;
    static constexpr int kBonusBoundaryDelimiter = kBonusBoundary + 1;
    static constexpr int kBonusNonWord = kScoreMatch / 2;
    static constexpr int kBonusCamel123 = kBonusBoundary - kPenaltyGapExtension;
    static constexpr int kBonusConsecutive = kPenaltyGapStart + kPenaltyGapExtension;
    static constexpr int kBonusFirstCharMultiplier = 2;

    explicit FuzzyMatcher(const QString& pattern);

    bool isEmpty() const { return m_needle.empty(); }
    bool caseSensitive() const { return m_caseSensitive; }

    std::optional<FuzzyMatch> match(const QString& haystack) const;

private:
    enum class CharClass { Whitespace, Delimiter, NonWord, Lower, Upper, Letter, Number };

    static CharClass classify(char32_t c);
    static int bonusFor(CharClass prev, CharClass current);
    char32_t fold(char32_t c) const;

    std::vector<char32_t> m_needle;
    bool m_caseSensitive = false;
    bool m_normalize = true;
};

} // namespace vanta
