#include "core/scripts/shell_words.h"

namespace vanta {

std::optional<QStringList> splitShellWords(const QString& input, QString* error)
{
    enum class State { Delimiter, Unquoted, UnquotedEscape, Single, Double, DoubleEscape, Comment };

    QStringList words;
    QString word;
    State state = State::Delimiter;

    for (const QChar c : input) {
        switch (state) {
        case State::Delimiter:
            if (c == QLatin1Char('\'')) {
                state = State::Single;
            } else if (c == QLatin1Char('"')) {
                state = State::Double;
            } else if (c == QLatin1Char('\\')) {
                state = State::UnquotedEscape;
            } else if (c == QLatin1Char('#')) {
                state = State::Comment;
            } else if (!c.isSpace()) {
                word.append(c);
                state = State::Unquoted;
            }
            break;
        case State::Unquoted:
            if (c == QLatin1Char('\'')) {
                state = State::Single;
            } else if (c == QLatin1Char('"')) {
                state = State::Double;
            } else if (c == QLatin1Char('\\')) {
                state = State::UnquotedEscape;
            } else if (c.isSpace()) {
                words.append(word);
                word.clear();
                state = State::Delimiter;
            } else {
                word.append(c);
            }
            break;
        case State::UnquotedEscape:
            if (c != QLatin1Char('\n')) {
                word.append(c);
            }
            state = State::Unquoted;
            break;
        case State::Single:
            if (c == QLatin1Char('\'')) {
                state = State::Unquoted;
            } else {
                word.append(c);
            }
            break;
        case State::Double:
            if (c == QLatin1Char('"')) {
                state = State::Unquoted;
            } else if (c == QLatin1Char('\\')) {
                state = State::DoubleEscape;
            } else {
                word.append(c);
            }
            break;
        case State::DoubleEscape:
            if (c == QLatin1Char('"') || c == QLatin1Char('\\')
                || c == QLatin1Char('$') || c == QLatin1Char('`')) {
                word.append(c);
            } else if (c != QLatin1Char('\n')) {
                word.append(QLatin1Char('\\'));
                word.append(c);
            }
            state = State::Double;
            break;
        case State::Comment:
            if (c == QLatin1Char('\n')) {
                state = State::Delimiter;
            }
            break;
        }
    }

    switch (state) {
    case State::Unquoted:
        words.append(word);
        break;
    case State::UnquotedEscape:
    case State::Single:
    case State::Double:
    case State::DoubleEscape:
        if (error) {
            *error = QStringLiteral("missing closing quote");
        }
        return std::nullopt;
    case State::Delimiter:
    case State::Comment:
        break;
    }
    return words;
}

} // namespace vanta
