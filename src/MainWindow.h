#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QTabWidget>

class AppConfig;
class OrderNeedsForm;
class LossesForm;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(AppConfig &config, QWidget *parent = nullptr);

private:
    void setupUI();

    AppConfig &m_config;
    QTabWidget *m_tabWidget;
    OrderNeedsForm *m_orderNeedsForm;
    LossesForm *m_lossesForm;
};

#endif // MAINWINDOW_H
