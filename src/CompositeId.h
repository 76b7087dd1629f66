#ifndef COMPOSITEID_H
#define COMPOSITEID_H

#include <QString>

// Legacy stock identifiers look like scenario/kit/module/item/std_qty/exp_date,
// with "None" in the layers that do not apply. Only used when stock_data has
// no code column of its own.
class CompositeId {
public:
    // item field if set, else module, else kit, else the identifier verbatim
    static QString extractCode(const QString &uniqueId);
};

#endif // COMPOSITEID_H
