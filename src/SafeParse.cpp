#include "SafeParse.h"
#include <QRegularExpression>
#include <QMetaType>
#include <cmath>
#include <limits>

std::optional<int> SafeParse::toInt(const QVariant &value) {
    if (value.isNull() || !value.isValid())
        return std::nullopt;

    switch (value.userType()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Bool: {
        bool ok = false;
        qlonglong v = value.toLongLong(&ok);
        if (!ok || v > std::numeric_limits<int>::max() || v < std::numeric_limits<int>::min())
            return std::nullopt;
        return static_cast<int>(v);
    }
    case QMetaType::Double:
    case QMetaType::Float: {
        double d = value.toDouble();
        if (!std::isfinite(d) || d > std::numeric_limits<int>::max()
            || d < std::numeric_limits<int>::min())
            return std::nullopt;
        return static_cast<int>(d);
    }
    default:
        break;
    }

    QString s = value.toString().trimmed();
    if (!isIntegerText(s))
        return std::nullopt;
    bool ok = false;
    int v = s.toInt(&ok);
    if (!ok)
        return std::nullopt;
    return v;
}

int SafeParse::toInt(const QVariant &value, int fallback) {
    std::optional<int> v = toInt(value);
    return v ? *v : fallback;
}

std::optional<double> SafeParse::toDouble(const QVariant &value) {
    if (value.isNull() || !value.isValid())
        return std::nullopt;
    bool ok = false;
    double d = value.userType() == QMetaType::QString ? value.toString().trimmed().toDouble(&ok)
                                                      : value.toDouble(&ok);
    if (!ok || !std::isfinite(d))
        return std::nullopt;
    return d;
}

double SafeParse::toDouble(const QVariant &value, double fallback) {
    std::optional<double> v = toDouble(value);
    return v ? *v : fallback;
}

bool SafeParse::isIntegerText(const QString &text) {
    static const QRegularExpression rx(QStringLiteral("^[+-]?\\d+$"));
    return rx.match(text.trimmed()).hasMatch();
}

bool SafeParse::isPlaceholder(const QVariant &value) {
    if (value.isNull() || !value.isValid())
        return true;
    QString s = value.toString().trimmed();
    return s.isEmpty() || s == QLatin1String("None");
}

QString SafeParse::text(const QVariant &value) {
    return isPlaceholder(value) ? QString() : value.toString().trimmed();
}

bool SafeParse::isAllFilter(const QString &filter) {
    QString f = filter.trimmed();
    return f.isEmpty() || f.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0;
}
