#include "LossesForm.h"
#include "AppConfig.h"
#include "CsvSheetWriter.h"
#include "DatabaseManager.h"
#include "ItemClassifier.h"
#include "ItemTypeDelegate.h"
#include "Logging.h"
#include "LossAggregator.h"
#include "LossReport.h"
#include "LossTableModel.h"
#include "StoreLookups.h"
#include <QDateTime>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QVBoxLayout>

LossesForm::LossesForm(AppConfig &config, QWidget *parent)
    : QWidget(parent), m_config(config), m_model(nullptr) {
    setupUI();
    loadFilters();
    loadLosses();
}

void LossesForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QGridLayout *filters = new QGridLayout();
    m_scenarioCombo = new QComboBox(this);
    m_kitCombo = new QComboBox(this);
    m_moduleCombo = new QComboBox(this);
    m_typeCombo = new QComboBox(this);
    m_typeCombo->addItems({ QStringLiteral("All"), QStringLiteral("Kit"),
                            QStringLiteral("Module"), QStringLiteral("Item") });
    m_categoryCombo = new QComboBox(this);
    m_itemEdit = new QLineEdit(this);
    m_docEdit = new QLineEdit(this);
    m_fromEdit = new QLineEdit(this);
    m_toEdit = new QLineEdit(this);
    m_fromEdit->setPlaceholderText(tr("e.g. 2024-01-01, 03/2024, 2024"));
    m_toEdit->setPlaceholderText(tr("e.g. 31/12/2024, Dec-2024"));

    filters->addWidget(new QLabel(tr("Scenario:"), this), 0, 0);
    filters->addWidget(m_scenarioCombo, 0, 1);
    filters->addWidget(new QLabel(tr("Kit:"), this), 0, 2);
    filters->addWidget(m_kitCombo, 0, 3);
    filters->addWidget(new QLabel(tr("Module:"), this), 0, 4);
    filters->addWidget(m_moduleCombo, 0, 5);
    filters->addWidget(new QLabel(tr("Type:"), this), 0, 6);
    filters->addWidget(m_typeCombo, 0, 7);
    filters->addWidget(new QLabel(tr("Loss category:"), this), 1, 0);
    filters->addWidget(m_categoryCombo, 1, 1);
    filters->addWidget(new QLabel(tr("Item:"), this), 1, 2);
    filters->addWidget(m_itemEdit, 1, 3);
    filters->addWidget(new QLabel(tr("Document:"), this), 1, 4);
    filters->addWidget(m_docEdit, 1, 5);
    filters->addWidget(new QLabel(tr("From:"), this), 2, 0);
    filters->addWidget(m_fromEdit, 2, 1);
    filters->addWidget(new QLabel(tr("To:"), this), 2, 2);
    filters->addWidget(m_toEdit, 2, 3);
    layout->addLayout(filters);

    QHBoxLayout *btnLayout = new QHBoxLayout();
    m_searchBtn = new QPushButton(tr("Search"), this);
    m_clearBtn = new QPushButton(tr("Clear"), this);
    m_exportBtn = new QPushButton(tr("Export"), this);
    btnLayout->addWidget(m_searchBtn);
    btnLayout->addWidget(m_clearBtn);
    btnLayout->addWidget(m_exportBtn);
    btnLayout->addStretch();
    layout->addLayout(btnLayout);

    m_model = new LossTableModel(this);
    m_tableView = new QTableView(this);
    m_tableView->setModel(m_model);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers); // read-only
    m_tableView->setItemDelegate(new ItemTypeDelegate(LossTableModel::RowKindRole, this));
    m_tableView->horizontalHeader()->setStretchLastSection(true);
    layout->addWidget(m_tableView);

    m_summaryLabel = new QLabel(this);
    layout->addWidget(m_summaryLabel);

    connect(m_searchBtn, &QPushButton::clicked, this, &LossesForm::loadLosses);
    connect(m_clearBtn, &QPushButton::clicked, this, &LossesForm::clearFilters);
    connect(m_exportBtn, &QPushButton::clicked, this, &LossesForm::exportReport);

    setLayout(layout);
}

void LossesForm::loadFilters() {
    QSqlDatabase db = DatabaseManager::instance().database();
    m_scenarioCombo->clear();
    m_scenarioCombo->addItems(StoreLookups::withAll(StoreLookups::scenarioNames(db)));
    m_kitCombo->clear();
    m_kitCombo->addItems(StoreLookups::withAll(StoreLookups::kitNumbers(db)));
    m_moduleCombo->clear();
    m_moduleCombo->addItems(StoreLookups::withAll(StoreLookups::moduleNumbers(db)));
    m_categoryCombo->clear();
    m_categoryCombo->addItems(StoreLookups::withAll(StoreLookups::lossCategories()));
}

LossFilter LossesForm::currentFilter() const {
    LossFilter f;
    f.scenario = m_scenarioCombo->currentText();
    f.kit = m_kitCombo->currentText();
    f.module = m_moduleCombo->currentText();
    f.type = m_typeCombo->currentText();
    f.lossCategory = m_categoryCombo->currentText();
    f.itemSearch = m_itemEdit->text();
    f.docSearch = m_docEdit->text();
    f.dateFrom = m_fromEdit->text();
    f.dateTo = m_toEdit->text();
    return f;
}

void LossesForm::loadLosses() {
    QSqlDatabase db = DatabaseManager::instance().database();
    if (!db.isOpen()) {
        qCWarning(lcUi) << "losses not loaded, database closed";
        m_model->setRecords(QVector<LossRecord>());
        return;
    }

    CatalogItemClassifier classifier(db, m_config.language());
    LossAggregator aggregator(db, classifier);
    const QVector<LossRecord> records = aggregator.aggregate(currentFilter());
    m_model->setRecords(records);
    m_tableView->resizeColumnsToContents();
    m_summaryLabel->setText(tr("%1 record(s), total quantity %2")
                                .arg(records.size()).arg(LossReport::totalQuantity(records)));
}

void LossesForm::clearFilters() {
    for (QComboBox *combo : { m_scenarioCombo, m_kitCombo, m_moduleCombo,
                              m_typeCombo, m_categoryCombo })
        combo->setCurrentIndex(0);
    for (QLineEdit *edit : { m_itemEdit, m_docEdit, m_fromEdit, m_toEdit })
        edit->clear();
    loadLosses();
}

void LossesForm::exportReport() {
    if (m_model->rowCount() == 0) {
        QMessageBox::information(this, tr("Export"), tr("No losses to export"));
        return;
    }

    const QDateTime now = QDateTime::currentDateTime();
    QString dir = m_config.exportDir();
    if (dir.isEmpty())
        dir = QDir::homePath();

    const QString fileName = QFileDialog::getSaveFileName(
        this, tr("Export losses"), QDir(dir).filePath(LossReport::defaultFileName(now)),
        tr("CSV files (*.csv)"));
    if (fileName.isEmpty())
        return;

    CsvSheetWriter writer;
    if (!writer.write(LossReport::build(m_model->records(), currentFilter(), now), fileName)) {
        QMessageBox::critical(this, tr("Export failed"),
                              tr("Could not write %1: %2").arg(fileName, writer.errorString()));
        return;
    }
    m_config.setExportDir(QFileInfo(fileName).absolutePath());
    QMessageBox::information(this, tr("Export"), tr("Losses saved to %1").arg(fileName));
}
