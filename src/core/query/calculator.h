#pragma once

#include <QString>
#include <optional>

namespace vanta {

// Arithmetic evaluator for the launcher's inline calculator.
//
// Grammar: + - * / % ^ (right-associative, binds tighter than unary minus),
// parentheses, decimal literals with optional exponent, constants pi and e,
// and the functions sqrt exp ln abs sin cos tan asin acos atan sinh cosh
// tanh asinh acosh atanh floor ceil round signum, atan2(y, x), max(...),
// min(...). Input without any decimal digit is rejected up front. Parse
// errors and non-finite results yield nullopt.
class Calculator {
public:
    static std::optional<double> evaluate(const QString& expression);

    // Shortest round-trip decimal text, never in exponent notation.
    static QString format(double value);
};

} // namespace vanta
