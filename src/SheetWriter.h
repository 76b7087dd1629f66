#ifndef SHEETWRITER_H
#define SHEETWRITER_H

#include "ReportTable.h"
#include <QString>

// Output format of a report. Implementations write the whole table or
// nothing useful; errorString() explains a false return.
class SheetWriter {
public:
    virtual ~SheetWriter() = default;

    virtual bool write(const ReportTable &table, const QString &fileName) = 0;
    virtual QString errorString() const = 0;
};

#endif // SHEETWRITER_H
