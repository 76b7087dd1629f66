#include "MainWindow.h"
#include "AppConfig.h"
#include "OrderNeedsForm.h"
#include "LossesForm.h"
#include "DatabaseManager.h"
#include <QMessageBox>

MainWindow::MainWindow(AppConfig &config, QWidget *parent)
    : QMainWindow(parent), m_config(config) {

    // initialize database
    if (!DatabaseManager::instance().open(m_config.databaseFile())) {
        QMessageBox::critical(this, tr("Database error"),
                              tr("Could not open database %1").arg(m_config.databaseFile()));
    }

    setupUI();

    setWindowTitle(tr("MedStock - Order Needs and Losses"));
    resize(1280, 760);
}

void MainWindow::setupUI() {
    m_tabWidget = new QTabWidget(this);

    m_orderNeedsForm = new OrderNeedsForm(m_config);
    m_lossesForm = new LossesForm(m_config);

    m_tabWidget->addTab(m_orderNeedsForm, tr("Order Needs"));
    m_tabWidget->addTab(m_lossesForm, tr("Losses"));

    setCentralWidget(m_tabWidget);
}
