#ifndef DATEPARSER_H
#define DATEPARSER_H

#include <QDate>
#include <QString>

// Parses the date filters typed by users.
//
// Accepted: yyyy-MM-dd, d/M/yyyy, d-M-yyyy, d Mon yyyy, d Month yyyy,
// yyyy/M/d; month only: yyyy-M, M/yyyy, Mon-yyyy, Month-yyyy; year only:
// yyyy. Month names are English and case-insensitive. A month or year
// without a day resolves to its first day as a range start and to its last
// day as a range end.
class DateParser {
public:
    enum Role { RangeStart, RangeEnd };

    // invalid QDate when the text is empty or not understood
    static QDate parse(const QString &text, Role role);

    // Both bounds of a filter range. An end after today becomes today, then
    // reversed bounds are swapped. Unparsable bounds stay invalid (open).
    static void resolveRange(const QString &fromText, const QString &toText,
                             const QDate &today, QDate *from, QDate *to);

    // 1..12, 0 when not a month name or abbreviation
    static int monthFromName(const QString &name);
};

#endif // DATEPARSER_H
