#ifndef SAFEPARSE_H
#define SAFEPARSE_H

#include <QString>
#include <QVariant>
#include <optional>

// Tolerant coercions for values read from the store or typed by the user.
// Nothing here throws; callers choose between "skip" and "default".
class SafeParse {
public:
    // integers, integral reals (truncated) and integer text; nullopt otherwise
    static std::optional<int> toInt(const QVariant &value);
    static int toInt(const QVariant &value, int fallback);

    static std::optional<double> toDouble(const QVariant &value);
    static double toDouble(const QVariant &value, double fallback);

    // optional sign followed by digits, surrounding blanks ignored
    static bool isIntegerText(const QString &text);

    // null, empty and the literal "None" stand for "no value" in the store
    static bool isPlaceholder(const QVariant &value);
    static QString text(const QVariant &value);

    // an empty filter or "All" matches everything
    static bool isAllFilter(const QString &filter);
};

#endif // SAFEPARSE_H
