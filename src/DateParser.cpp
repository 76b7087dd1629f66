#include "DateParser.h"
#include <QLocale>
#include <QRegularExpression>
#include <utility>

namespace {

QDate monthBound(int year, int month, DateParser::Role role) {
    QDate first(year, month, 1);
    if (!first.isValid())
        return QDate();
    return role == DateParser::RangeStart ? first : QDate(year, month, first.daysInMonth());
}

} // namespace

int DateParser::monthFromName(const QString &name) {
    const QLocale c = QLocale::c();
    for (int m = 1; m <= 12; ++m) {
        if (name.compare(c.monthName(m, QLocale::ShortFormat), Qt::CaseInsensitive) == 0
            || name.compare(c.monthName(m, QLocale::LongFormat), Qt::CaseInsensitive) == 0)
            return m;
    }
    return 0;
}

QDate DateParser::parse(const QString &text, Role role) {
    const QString raw = text.simplified();
    if (raw.isEmpty())
        return QDate();

    static const QRegularExpression isoDate(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})$"));
    static const QRegularExpression slashDate(QStringLiteral("^(\\d{1,2})/(\\d{1,2})/(\\d{4})$"));
    static const QRegularExpression dashDate(QStringLiteral("^(\\d{1,2})-(\\d{1,2})-(\\d{4})$"));
    static const QRegularExpression namedDate(QStringLiteral("^(\\d{1,2}) ([A-Za-z]+) (\\d{4})$"));
    static const QRegularExpression ymdSlash(QStringLiteral("^(\\d{4})/(\\d{1,2})/(\\d{1,2})$"));
    static const QRegularExpression isoMonth(QStringLiteral("^(\\d{4})-(\\d{1,2})$"));
    static const QRegularExpression slashMonth(QStringLiteral("^(\\d{1,2})/(\\d{4})$"));
    static const QRegularExpression namedMonth(QStringLiteral("^([A-Za-z]+)-(\\d{4})$"));
    static const QRegularExpression yearOnly(QStringLiteral("^(\\d{4})$"));

    QRegularExpressionMatch m;

    // full dates
    if ((m = isoDate.match(raw)).hasMatch() || (m = ymdSlash.match(raw)).hasMatch())
        return QDate(m.captured(1).toInt(), m.captured(2).toInt(), m.captured(3).toInt());
    if ((m = slashDate.match(raw)).hasMatch() || (m = dashDate.match(raw)).hasMatch())
        return QDate(m.captured(3).toInt(), m.captured(2).toInt(), m.captured(1).toInt());
    if ((m = namedDate.match(raw)).hasMatch()) {
        int month = monthFromName(m.captured(2));
        if (month == 0)
            return QDate();
        return QDate(m.captured(3).toInt(), month, m.captured(1).toInt());
    }

    // month only
    if ((m = isoMonth.match(raw)).hasMatch())
        return monthBound(m.captured(1).toInt(), m.captured(2).toInt(), role);
    if ((m = slashMonth.match(raw)).hasMatch())
        return monthBound(m.captured(2).toInt(), m.captured(1).toInt(), role);
    if ((m = namedMonth.match(raw)).hasMatch()) {
        int month = monthFromName(m.captured(1));
        if (month == 0)
            return QDate();
        return monthBound(m.captured(2).toInt(), month, role);
    }

    if ((m = yearOnly.match(raw)).hasMatch()) {
        int year = m.captured(1).toInt();
        return role == RangeStart ? QDate(year, 1, 1) : QDate(year, 12, 31);
    }
    return QDate();
}

void DateParser::resolveRange(const QString &fromText, const QString &toText,
                              const QDate &today, QDate *from, QDate *to) {
    QDate f = parse(fromText, RangeStart);
    QDate t = parse(toText, RangeEnd);
    if (t.isValid() && today.isValid() && t > today)
        t = today;
    if (f.isValid() && t.isValid() && f > t)
        std::swap(f, t);
    if (from)
        *from = f;
    if (to)
        *to = t;
}
