#ifndef LOSSESFORM_H
#define LOSSESFORM_H

#include <QWidget>
#include <QTableView>
#include <QPushButton>
#include <QComboBox>
#include <QLineEdit>
#include <QLabel>

class AppConfig;
class LossTableModel;
struct LossFilter;

class LossesForm : public QWidget {
    Q_OBJECT
public:
    LossesForm(AppConfig &config, QWidget *parent = nullptr);

public slots:
    void loadLosses();

private slots:
    void clearFilters();
    void exportReport();

private:
    void setupUI();
    void loadFilters();
    LossFilter currentFilter() const;

    AppConfig &m_config;

    QComboBox *m_scenarioCombo;
    QComboBox *m_kitCombo;
    QComboBox *m_moduleCombo;
    QComboBox *m_typeCombo;
    QComboBox *m_categoryCombo;
    QLineEdit *m_itemEdit;
    QLineEdit *m_docEdit;
    QLineEdit *m_fromEdit;
    QLineEdit *m_toEdit;
    QPushButton *m_searchBtn;
    QPushButton *m_clearBtn;
    QPushButton *m_exportBtn;
    QLabel *m_summaryLabel;
    QTableView *m_tableView;
    LossTableModel *m_model;
};

#endif // LOSSESFORM_H
