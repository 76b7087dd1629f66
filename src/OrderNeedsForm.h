#ifndef ORDERNEEDSFORM_H
#define ORDERNEEDSFORM_H

#include <QWidget>
#include <QTableView>
#include <QPushButton>
#include <QComboBox>
#include <QLineEdit>
#include <QSpinBox>
#include <QLabel>

class AppConfig;
class OrderNeedsModel;

class OrderNeedsForm : public QWidget {
    Q_OBJECT
public:
    OrderNeedsForm(AppConfig &config, QWidget *parent = nullptr);

public slots:
    void loadRows();

private slots:
    void changeMode(int index);
    void updateTotals();
    void showRejectedEdit(const QString &message);
    void exportReport();

private:
    void setupUI();
    void loadFilters();

    AppConfig &m_config;
    QString m_projectName;
    QString m_projectCode;

    QComboBox *m_kitCombo;
    QComboBox *m_moduleCombo;
    QComboBox *m_typeCombo;
    QLineEdit *m_searchEdit;
    QSpinBox *m_leadSpin;
    QSpinBox *m_coverSpin;
    QSpinBox *m_bufferSpin;
    QComboBox *m_modeCombo;
    QPushButton *m_refreshBtn;
    QPushButton *m_exportBtn;
    QLabel *m_totalsLabel;
    QTableView *m_tableView;
    OrderNeedsModel *m_model;
};

#endif // ORDERNEEDSFORM_H
