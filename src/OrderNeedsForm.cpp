#include "OrderNeedsForm.h"
#include "AppConfig.h"
#include "CsvSheetWriter.h"
#include "DatabaseManager.h"
#include "ItemClassifier.h"
#include "ItemTypeDelegate.h"
#include "Logging.h"
#include "OrderCalculator.h"
#include "OrderData.h"
#include "OrderNeedsModel.h"
#include "OrderReport.h"
#include "ProjectSettings.h"
#include "StoreLookups.h"
#include <QDateTime>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QMessageBox>
#include <QVBoxLayout>

OrderNeedsForm::OrderNeedsForm(AppConfig &config, QWidget *parent)
    : QWidget(parent), m_config(config), m_model(nullptr) {
    setupUI();
    loadFilters();
    loadRows();
}

void OrderNeedsForm::setupUI() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    // filters
    QHBoxLayout *filterLayout = new QHBoxLayout();
    m_kitCombo = new QComboBox(this);
    m_moduleCombo = new QComboBox(this);
    m_typeCombo = new QComboBox(this);
    m_typeCombo->addItems({ QStringLiteral("All"), QStringLiteral("Kit"),
                            QStringLiteral("Module"), QStringLiteral("Item") });
    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setPlaceholderText(tr("Search item code or description"));

    filterLayout->addWidget(new QLabel(tr("Kit:"), this));
    filterLayout->addWidget(m_kitCombo);
    filterLayout->addWidget(new QLabel(tr("Module:"), this));
    filterLayout->addWidget(m_moduleCombo);
    filterLayout->addWidget(new QLabel(tr("Type:"), this));
    filterLayout->addWidget(m_typeCombo);
    filterLayout->addWidget(m_searchEdit, 1);
    layout->addLayout(filterLayout);

    // planning months
    QHBoxLayout *monthsLayout = new QHBoxLayout();
    m_leadSpin = new QSpinBox(this);
    m_coverSpin = new QSpinBox(this);
    m_bufferSpin = new QSpinBox(this);
    for (QSpinBox *spin : { m_leadSpin, m_coverSpin, m_bufferSpin }) {
        spin->setRange(ProjectSettings::MinMonths, ProjectSettings::MaxMonths);
        spin->setSuffix(tr(" months"));
    }
    m_modeCombo = new QComboBox(this);
    m_modeCombo->addItem(tr("Simple"), int(AppConfig::SimpleMode));
    m_modeCombo->addItem(tr("Detailed"), int(AppConfig::DetailedMode));
    m_refreshBtn = new QPushButton(tr("Refresh"), this);
    m_exportBtn = new QPushButton(tr("Export"), this);

    monthsLayout->addWidget(new QLabel(tr("Lead time:"), this));
    monthsLayout->addWidget(m_leadSpin);
    monthsLayout->addWidget(new QLabel(tr("Cover period:"), this));
    monthsLayout->addWidget(m_coverSpin);
    monthsLayout->addWidget(new QLabel(tr("Buffer:"), this));
    monthsLayout->addWidget(m_bufferSpin);
    monthsLayout->addStretch();
    monthsLayout->addWidget(m_modeCombo);
    monthsLayout->addWidget(m_refreshBtn);
    monthsLayout->addWidget(m_exportBtn);
    layout->addLayout(monthsLayout);

    // table
    m_model = new OrderNeedsModel(this);
    m_tableView = new QTableView(this);
    m_tableView->setModel(m_model);
    m_tableView->setItemDelegate(new ItemTypeDelegate(OrderNeedsModel::RowKindRole, this));
    m_tableView->setEditTriggers(QAbstractItemView::DoubleClicked | QAbstractItemView::EditKeyPressed);
    m_tableView->horizontalHeader()->setStretchLastSection(true);
    layout->addWidget(m_tableView);

    m_totalsLabel = new QLabel(this);
    layout->addWidget(m_totalsLabel);

    m_modeCombo->setCurrentIndex(m_modeCombo->findData(int(m_config.reportMode())));
    m_model->setMode(m_config.reportMode());

    connect(m_refreshBtn, &QPushButton::clicked, this, &OrderNeedsForm::loadRows);
    connect(m_exportBtn, &QPushButton::clicked, this, &OrderNeedsForm::exportReport);
    connect(m_modeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &OrderNeedsForm::changeMode);
    connect(m_searchEdit, &QLineEdit::returnPressed, this, &OrderNeedsForm::loadRows);
    connect(m_model, &OrderNeedsModel::totalsChanged, this, &OrderNeedsForm::updateTotals);
    connect(m_model, &OrderNeedsModel::editRejected, this, &OrderNeedsForm::showRejectedEdit);

    setLayout(layout);
}

void OrderNeedsForm::loadFilters() {
    QSqlDatabase db = DatabaseManager::instance().database();

    m_kitCombo->clear();
    m_kitCombo->addItems(StoreLookups::withAll(StoreLookups::kitNumbers(db)));
    m_moduleCombo->clear();
    m_moduleCombo->addItems(StoreLookups::withAll(StoreLookups::moduleNumbers(db)));

    const ProjectSettings project = ProjectSettings::load(db);
    m_leadSpin->setValue(project.leadMonths());
    m_coverSpin->setValue(project.coverMonths());
    m_bufferSpin->setValue(project.bufferMonths());
    m_projectName = project.projectName();
    m_projectCode = project.projectCode();
}

void OrderNeedsForm::loadRows() {
    QSqlDatabase db = DatabaseManager::instance().database();
    if (!db.isOpen()) {
        qCWarning(lcUi) << "order needs not loaded, database closed";
        m_model->setRows(QVector<OrderRow>());
        return;
    }

    CatalogItemClassifier classifier(db, m_config.language());
    OrderData data(db, classifier,
                   m_kitCombo->currentText(), m_moduleCombo->currentText(),
                   m_typeCombo->currentText(), m_searchEdit->text(),
                   m_leadSpin->value(), m_coverSpin->value(), m_bufferSpin->value());
    m_model->setRows(data.fetch());
    m_tableView->resizeColumnsToContents();
    qCDebug(lcUi) << "order needs loaded:" << m_model->rowCount() << "rows";
}

void OrderNeedsForm::changeMode(int index) {
    const auto mode = AppConfig::ReportMode(m_modeCombo->itemData(index).toInt());
    m_model->setMode(mode);
    m_config.setReportMode(mode);
    m_tableView->resizeColumnsToContents();
}

void OrderNeedsForm::updateTotals() {
    const OrderCalculator::Totals t = OrderCalculator::totals(m_model->rows());
    QString text = tr("Total amount: %1 EUR    Weight: %2 kg    Volume: %3 m3")
                       .arg(ReportTable::number(t.amount, 2),
                            ReportTable::number(t.weightKg, 3),
                            ReportTable::number(t.volumeM3, 4));
    if (t.missingPriceRows > 0)
        text += tr("    (%n row(s) without price)", nullptr, t.missingPriceRows);
    m_totalsLabel->setText(text);
}

void OrderNeedsForm::showRejectedEdit(const QString &message) {
    QMessageBox::warning(this, tr("Invalid value"), message);
}

void OrderNeedsForm::exportReport() {
    const QDateTime now = QDateTime::currentDateTime();
    QString dir = m_config.exportDir();
    if (dir.isEmpty())
        dir = QDir::homePath();

    const QString fileName = QFileDialog::getSaveFileName(
        this, tr("Export order needs"), QDir(dir).filePath(OrderReport::defaultFileName(now)),
        tr("CSV files (*.csv)"));
    if (fileName.isEmpty())
        return;

    OrderReport::Filters filters;
    filters.projectName = m_projectName;
    filters.projectCode = m_projectCode;
    filters.kit = m_kitCombo->currentText();
    filters.module = m_moduleCombo->currentText();
    filters.type = m_typeCombo->currentText();
    filters.itemSearch = m_searchEdit->text();
    filters.leadMonths = m_leadSpin->value();
    filters.coverMonths = m_coverSpin->value();
    filters.bufferMonths = m_bufferSpin->value();

    CsvSheetWriter writer;
    if (!writer.write(OrderReport::build(m_model->rows(), m_model->mode(), filters, now), fileName)) {
        QMessageBox::critical(this, tr("Export failed"),
                              tr("Could not write %1: %2").arg(fileName, writer.errorString()));
        return;
    }
    m_config.setExportDir(QFileInfo(fileName).absolutePath());
    QMessageBox::information(this, tr("Export"), tr("Order needs saved to %1").arg(fileName));
}
