#ifndef LOSSRECORD_H
#define LOSSRECORD_H

#include "ItemClassifier.h"
#include <QString>

// Filters of the losses report, as typed by the user. Empty or "All"
// means no restriction; dates go through DateParser.
struct LossFilter {
    QString scenario;
    QString kit;
    QString module;
    QString type;
    QString lossCategory;
    QString itemSearch;
    QString docSearch;
    QString dateFrom;
    QString dateTo;
};

// Losses of one item on one date for one loss category. The list fields are
// sorted, de-duplicated and joined with ", ".
struct LossRecord {
    QString date;
    QString code;
    QString description;
    ItemClassifier::Type type = ItemClassifier::Item;
    QString lossCategory;
    int quantity = 0;
    QString scenarios;
    QString kits;
    QString modules;
    QString expiryDates;
    QString documents;
    QString remarks;

    QString typeName() const { return ItemClassifier::typeName(type); }
};

#endif // LOSSRECORD_H
