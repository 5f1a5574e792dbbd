#include "core/query/calculator.h"

#include <QLocale>

#include <cmath>
#include <vector>

namespace vanta {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

// Recursive-descent parser over the expression text.
//
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/' | '%') unary)*
//   unary   := ('+' | '-') unary | power
//   power   := primary ('^' unary)?
//   primary := number | ident | ident '(' args ')' | '(' expr ')'
class Parser {
public:
    explicit Parser(const QString& text)
        : m_text(text)
    {
    }

    std::optional<double> parse()
    {
        std::optional<double> value = parseExpr();
        skipSpaces();
        if (!value || m_pos != m_text.size()) {
            return std::nullopt;
        }
        return value;
    }

private:
    static constexpr int kMaxDepth = 256;

    void skipSpaces()
    {
        while (m_pos < m_text.size() && m_text.at(m_pos).isSpace()) {
            ++m_pos;
        }
    }

    bool consume(QChar c)
    {
        skipSpaces();
        if (m_pos < m_text.size() && m_text.at(m_pos) == c) {
            ++m_pos;
            return true;
        }
        return false;
    }

    std::optional<double> parseExpr()
    {
        if (++m_depth > kMaxDepth) {
            return std::nullopt;
        }
        std::optional<double> lhs = parseTerm();
        while (lhs) {
            if (consume(QLatin1Char('+'))) {
                const std::optional<double> rhs = parseTerm();
                if (!rhs) {
                    return std::nullopt;
                }
                *lhs += *rhs;
            } else if (consume(QLatin1Char('-'))) {
                const std::optional<double> rhs = parseTerm();
                if (!rhs) {
                    return std::nullopt;
                }
                *lhs -= *rhs;
            } else {
                break;
            }
        }
        --m_depth;
        return lhs;
    }

    std::optional<double> parseTerm()
    {
        std::optional<double> lhs = parseUnary();
        while (lhs) {
            QChar op;
            if (consume(QLatin1Char('*'))) {
                op = QLatin1Char('*');
            } else if (consume(QLatin1Char('/'))) {
                op = QLatin1Char('/');
            } else if (consume(QLatin1Char('%'))) {
                op = QLatin1Char('%');
            } else {
                break;
            }
            const std::optional<double> rhs = parseUnary();
            if (!rhs) {
                return std::nullopt;
            }
            if (op == QLatin1Char('*')) {
                *lhs *= *rhs;
            } else if (op == QLatin1Char('/')) {
                *lhs /= *rhs;
            } else {
                *lhs = std::fmod(*lhs, *rhs);
            }
        }
        return lhs;
    }

    std::optional<double> parseUnary()
    {
        if (++m_depth > kMaxDepth) {
            return std::nullopt;
        }
        std::optional<double> value;
        if (consume(QLatin1Char('-'))) {
            value = parseUnary();
            if (value) {
                *value = -*value;
            }
        } else if (consume(QLatin1Char('+'))) {
            value = parseUnary();
        } else {
            value = parsePower();
        }
        --m_depth;
        return value;
    }

    std::optional<double> parsePower()
    {
        std::optional<double> base = parsePrimary();
        if (base && consume(QLatin1Char('^'))) {
            const std::optional<double> exponent = parseUnary();
            if (!exponent) {
                return std::nullopt;
            }
            *base = std::pow(*base, *exponent);
        }
        return base;
    }

    std::optional<double> parsePrimary()
    {
        skipSpaces();
        if (m_pos >= m_text.size()) {
            return std::nullopt;
        }

        const QChar c = m_text.at(m_pos);
        if (c == QLatin1Char('(')) {
            ++m_pos;
            std::optional<double> inner = parseExpr();
            if (!inner || !consume(QLatin1Char(')'))) {
                return std::nullopt;
            }
            return inner;
        }
        if (c.isDigit() || c == QLatin1Char('.')) {
            return parseNumber();
        }
        if (c.isLetter() || c == QLatin1Char('_')) {
            return parseIdentifier();
        }
        return std::nullopt;
    }

    std::optional<double> parseNumber()
    {
        const int start = m_pos;
        bool sawDigit = false;
        while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) {
            ++m_pos;
            sawDigit = true;
        }
        if (m_pos < m_text.size() && m_text.at(m_pos) == QLatin1Char('.')) {
            ++m_pos;
            while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) {
                ++m_pos;
                sawDigit = true;
            }
        }
        if (!sawDigit) {
            return std::nullopt;
        }

        // Exponent only when digits follow; "2e" stays a syntax error.
        if (m_pos < m_text.size()
            && (m_text.at(m_pos) == QLatin1Char('e') || m_text.at(m_pos) == QLatin1Char('E'))) {
            int cursor = m_pos + 1;
            if (cursor < m_text.size()
                && (m_text.at(cursor) == QLatin1Char('+') || m_text.at(cursor) == QLatin1Char('-'))) {
                ++cursor;
            }
            if (cursor < m_text.size() && m_text.at(cursor).isDigit()) {
                m_pos = cursor;
                while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) {
                    ++m_pos;
                }
            }
        }

        bool ok = false;
        const double value = QStringView(m_text).mid(start, m_pos - start).toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> parseIdentifier()
    {
        const int start = m_pos;
        while (m_pos < m_text.size()
               && (m_text.at(m_pos).isLetterOrNumber() || m_text.at(m_pos) == QLatin1Char('_'))) {
            ++m_pos;
        }
        const QString name = m_text.mid(start, m_pos - start);

        skipSpaces();
        if (m_pos < m_text.size() && m_text.at(m_pos) == QLatin1Char('(')) {
            ++m_pos;
            std::vector<double> args;
            if (!consume(QLatin1Char(')'))) {
                do {
                    const std::optional<double> arg = parseExpr();
                    if (!arg) {
                        return std::nullopt;
                    }
                    args.push_back(*arg);
                } while (consume(QLatin1Char(',')));
                if (!consume(QLatin1Char(')'))) {
                    return std::nullopt;
                }
            }
            return callFunction(name, args);
        }

        if (name == QLatin1String("pi")) {
            return kPi;
        }
        if (name == QLatin1String("e")) {
            return kE;
        }
        return std::nullopt;
    }

    static std::optional<double> callFunction(const QString& name, const std::vector<double>& args)
    {
        if (name == QLatin1String("max") || name == QLatin1String("min")) {
            if (args.empty()) {
                return std::nullopt;
            }
            double result = args.front();
            for (double arg : args) {
                result = name == QLatin1String("max") ? std::fmax(result, arg) : std::fmin(result, arg);
            }
            return result;
        }

        if (name == QLatin1String("atan2")) {
            if (args.size() != 2) {
                return std::nullopt;
            }
            return std::atan2(args[0], args[1]);
        }

        if (args.size() != 1) {
            return std::nullopt;
        }
        const double x = args.front();

        using Fn = double (*)(double);
        struct Entry {
            const char* name;
            Fn fn;
        };
        static const Entry kFunctions[] = {
            {"sqrt", [](double v) { return std::sqrt(v); }},
            {"exp", [](double v) { return std::exp(v); }},
            {"ln", [](double v) { return std::log(v); }},
            {"abs", [](double v) { return std::fabs(v); }},
            {"sin", [](double v) { return std::sin(v); }},
            {"cos", [](double v) { return std::cos(v); }},
            {"tan", [](double v) { return std::tan(v); }},
            {"asin", [](double v) { return std::asin(v); }},
            {"acos", [](double v) { return std::acos(v); }},
            {"atan", [](double v) { return std::atan(v); }},
            {"sinh", [](double v) { return std::sinh(v); }},
            {"cosh", [](double v) { return std::cosh(v); }},
            {"tanh", [](double v) { return std::tanh(v); }},
            {"asinh", [](double v) { return std::asinh(v); }},
            {"acosh", [](double v) { return std::acosh(v); }},
            {"atanh", [](double v) { return std::atanh(v); }},
            {"floor", [](double v) { return std::floor(v); }},
            {"ceil", [](double v) { return std::ceil(v); }},
            {"round", [](double v) { return std::round(v); }},
            {"signum", [](double v) { return std::isnan(v) ? v : (std::signbit(v) ? -1.0 : 1.0); }},
        };
        for (const Entry& entry : kFunctions) {
            if (name == QLatin1String(entry.name)) {
                return entry.fn(x);
            }
        }
        return std::nullopt;
    }

    const QString& m_text;
    int m_pos = 0;
    int m_depth = 0;
};

} // namespace

std::optional<double> Calculator::evaluate(const QString& expression)
{
    const QString trimmed = expression.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    bool hasDigit = false;
    for (const QChar c : trimmed) {
        if (c >= QLatin1Char('0') && c <= QLatin1Char('9')) {
            hasDigit = true;
            break;
        }
    }
    if (!hasDigit) {
        return std::nullopt;
    }

    const std::optional<double> value = Parser(trimmed).parse();
    if (!value || !std::isfinite(*value)) {
        return std::nullopt;
    }
    return value;
}

QString Calculator::format(double value)
{
    if (value == 0.0) {
        return std::signbit(value) ? QStringLiteral("-0") : QStringLiteral("0");
    }
    return QString::number(value, 'f', QLocale::FloatingPointShortest);
}

} // namespace vanta
