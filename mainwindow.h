#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QJsonObject>
#include "models.h"

class QTabWidget;
class QTableView;
class QListWidget;
class QLabel;
class QProgressBar;
class QTextEdit;
class QCheckBox;
class QDateEdit;
class QPushButton;
class QComboBox;
class EventTableModel;
class ReminderEngine;
class ConfigManager;
class DietAnalyzer;
class PregnancyTipsGenerator;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(ReminderEngine* engine, ConfigManager* config, DietAnalyzer* dietAnalyzer,
               PregnancyTipsGenerator* tipsGenerator, QWidget *parent = nullptr);
    ~MainWindow();

public slots:
    void showAndRaise();
    // 切到“今日”页并显示当前提醒
    void showActiveReminders();
    void refreshWater();

protected:
    // 关闭窗口只隐藏到托盘
    void closeEvent(QCloseEvent *event) override;

private slots:
    // 今日
    void onWaterButtonClicked(int amount);
    void onBtnDeleteWaterClicked();
    void onBtnWaterStatisticClicked();
    void onBtnSnoozeClicked();
    void onBtnDismissClicked();
    void refreshActiveReminders();
    void onAiModeChanged(int index);
    // 事件
    void onBtnAddEventClicked();
    void onBtnEditEventClicked();
    void onBtnDeleteEventClicked();
    void onBtnAddMedicationClicked();
    void onBtnDeleteMedicationClicked();
    // 孕期
    void onBtnSavePregnancyClicked();
    void onBtnRefreshTipsClicked();
    void onBtnFetalStartClicked();
    void onBtnFetalCountClicked();
    void onBtnFetalEndClicked();
    // 饮食
    void onBtnRecordMealClicked();
    void onBtnAnalyzeDietClicked();

private:
    QWidget* createTodayTab();
    QWidget* createEventTab();
    QWidget* createPregnancyTab();
    QWidget* createDietTab();

    void refreshCountdowns();
    void refreshEvents();
    void refreshMedications();
    bool showMedicationDialog(Medication &medication);
    void refreshPregnancyInfo();
    void refreshDiet();
    void refreshFetalMovement();
    int pregnancyWeek() const;
    static QString formatFullTips(const QJsonObject& tips);

    ReminderEngine* m_engine;
    ConfigManager* m_config;
    DietAnalyzer* m_dietAnalyzer;
    PregnancyTipsGenerator* m_tipsGenerator;

    QTabWidget* m_tabWidget;

    // 今日
    QProgressBar* m_waterProgress;
    QLabel* m_labelWater;
    QListWidget* m_listWater;
    QListWidget* m_listReminders;
    QListWidget* m_listCountdowns;
    QComboBox* m_comboAiMode;

    // 事件
    QTableView* m_tableEvents;
    EventTableModel* m_eventModel;
    QListWidget* m_listMedications;

    // 孕期
    QCheckBox* m_checkPregnancy;
    QDateEdit* m_dateLastPeriod;
    QLabel* m_labelWeekInfo;
    QTextEdit* m_textTips;
    QLabel* m_labelFetal;
    QPushButton* m_btnFetalStart;
    QPushButton* m_btnFetalCount;
    QPushButton* m_btnFetalEnd;
    FetalMovementRecord m_fetalSession;     // id 为空表示没有进行中的计数

    // 饮食
    QTextEdit* m_textMeals;
    QTextEdit* m_textAnalysis;
    QPushButton* m_btnAnalyze;
};

#endif // MAINWINDOW_H
