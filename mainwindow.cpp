#include "mainwindow.h"
#include "databasemanager.h"
#include "configmanager.h"
#include "reminderengine.h"
#include "dietanalyzer.h"
#include "pregnancytips.h"
#include "pregnancycalculator.h"
#include "eventtablemodel.h"
#include "addeventdialog.h"
#include "dietrecorddialog.h"
#include "waterstatisticdialog.h"
#include "trayicon.h"
#include "helpers.h"
#include <QMessageBox>
#include <QTabWidget>
#include <QTableView>
#include <QListWidget>
#include <QLabel>
#include <QProgressBar>
#include <QTextEdit>
#include <QCheckBox>
#include <QDateEdit>
#include <QPushButton>
#include <QComboBox>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QFormLayout>
#include <QDialog>
#include <QLineEdit>
#include <QSpinBox>
#include <QRegularExpression>
#include <QHeaderView>
#include <QCloseEvent>
#include <QPointer>
#include <QDebug>

MainWindow::MainWindow(ReminderEngine* engine, ConfigManager* config, DietAnalyzer* dietAnalyzer,
                       PregnancyTipsGenerator* tipsGenerator, QWidget *parent)
    : QMainWindow(parent)
    , m_engine(engine)
    , m_config(config)
    , m_dietAnalyzer(dietAnalyzer)
    , m_tipsGenerator(tipsGenerator)
    , m_tabWidget(new QTabWidget(this))
    , m_eventModel(new EventTableModel(this))
{
    setWindowTitle(QString("%1 %2").arg(APP_NAME, APP_VERSION));
    setWindowIcon(TrayIcon::createDefaultIcon());
    resize(760, 560);

    m_tabWidget->addTab(createTodayTab(), "今日");
    m_tabWidget->addTab(createEventTab(), "事件");
    m_tabWidget->addTab(createPregnancyTab(), "孕期");
    m_tabWidget->addTab(createDietTab(), "饮食");
    setCentralWidget(m_tabWidget);

    connect(m_engine, &ReminderEngine::activeRemindersChanged, this, &MainWindow::refreshActiveReminders);

    // 启动时刷新所有数据
    refreshWater();
    refreshActiveReminders();
    refreshCountdowns();
    refreshEvents();
    refreshPregnancyInfo();
    refreshFetalMovement();
    refreshDiet();
}

MainWindow::~MainWindow()
{
}

// ---------- 今日 ----------

QWidget* MainWindow::createTodayTab()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);

    // 饮水
    QGroupBox* waterGroup = new QGroupBox("💧 今日饮水", page);
    QVBoxLayout* waterLayout = new QVBoxLayout(waterGroup);
    m_waterProgress = new QProgressBar(waterGroup);
    m_labelWater = new QLabel(waterGroup);
    waterLayout->addWidget(m_labelWater);
    waterLayout->addWidget(m_waterProgress);

    QHBoxLayout* quickLayout = new QHBoxLayout();
    for (int amount : TrayIcon::quickWaterAmounts()) {
        QPushButton* btn = new QPushButton(QString("+%1 ml").arg(amount), waterGroup);
        connect(btn, &QPushButton::clicked, this, [this, amount]() {
            onWaterButtonClicked(amount);
        });
        quickLayout->addWidget(btn);
    }
    waterLayout->addLayout(quickLayout);

    m_listWater = new QListWidget(waterGroup);
    m_listWater->setMaximumHeight(110);
    waterLayout->addWidget(m_listWater);

    QHBoxLayout* waterBtnLayout = new QHBoxLayout();
    QPushButton* btnDeleteWater = new QPushButton("删除选中记录", waterGroup);
    QPushButton* btnStatistic = new QPushButton("饮水统计", waterGroup);
    waterBtnLayout->addWidget(btnDeleteWater);
    waterBtnLayout->addStretch();
    waterBtnLayout->addWidget(btnStatistic);
    waterLayout->addLayout(waterBtnLayout);
    layout->addWidget(waterGroup);

    // 当前提醒和倒计时
    QHBoxLayout* bottomLayout = new QHBoxLayout();

    QGroupBox* reminderGroup = new QGroupBox("🔔 当前提醒", page);
    QVBoxLayout* reminderLayout = new QVBoxLayout(reminderGroup);
    m_listReminders = new QListWidget(reminderGroup);
    reminderLayout->addWidget(m_listReminders);
    QHBoxLayout* reminderBtnLayout = new QHBoxLayout();
    QPushButton* btnSnooze = new QPushButton("稍后提醒", reminderGroup);
    QPushButton* btnDismiss = new QPushButton("知道了", reminderGroup);
    reminderBtnLayout->addStretch();
    reminderBtnLayout->addWidget(btnSnooze);
    reminderBtnLayout->addWidget(btnDismiss);
    reminderLayout->addLayout(reminderBtnLayout);
    bottomLayout->addWidget(reminderGroup, 3);

    QGroupBox* countdownGroup = new QGroupBox("⏳ 倒计时", page);
    QVBoxLayout* countdownLayout = new QVBoxLayout(countdownGroup);
    m_listCountdowns = new QListWidget(countdownGroup);
    countdownLayout->addWidget(m_listCountdowns);
    bottomLayout->addWidget(countdownGroup, 2);
    layout->addLayout(bottomLayout, 1);

    // AI 模式
    QHBoxLayout* aiLayout = new QHBoxLayout();
    m_comboAiMode = new QComboBox(page);
    const QString currentMode = m_config->get("ai_mode", "smart").toString();
    for (const QString& mode : aiModeNames()) {
        const AiModeOption option = aiModeOption(mode);
        m_comboAiMode->addItem(option.name, mode);
        m_comboAiMode->setItemData(m_comboAiMode->count() - 1, option.desc, Qt::ToolTipRole);
    }
    const int modeIndex = m_comboAiMode->findData(currentMode);
    m_comboAiMode->setCurrentIndex(modeIndex >= 0 ? modeIndex : 0);
    aiLayout->addWidget(new QLabel("AI 模式：", page));
    aiLayout->addWidget(m_comboAiMode);
    aiLayout->addStretch();
    layout->addLayout(aiLayout);

    connect(btnDeleteWater, &QPushButton::clicked, this, &MainWindow::onBtnDeleteWaterClicked);
    connect(btnStatistic, &QPushButton::clicked, this, &MainWindow::onBtnWaterStatisticClicked);
    connect(btnSnooze, &QPushButton::clicked, this, &MainWindow::onBtnSnoozeClicked);
    connect(btnDismiss, &QPushButton::clicked, this, &MainWindow::onBtnDismissClicked);
    connect(m_comboAiMode, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &MainWindow::onAiModeChanged);

    return page;
}

void MainWindow::refreshWater()
{
    const QDate today = QDate::currentDate();
    const int total = DatabaseManager::instance().getWaterTotal(today);
    const int target = m_config->get("water_reminder.daily_target", 1800).toInt();

    m_waterProgress->setRange(0, qMax(1, target));
    m_waterProgress->setValue(qMin(total, target));
    m_waterProgress->setFormat(QString("%1%").arg(target > 0 ? total * 100 / target : 0));

    QString text = QString("已喝 %1 ml / 目标 %2 ml").arg(total).arg(target);
    if (total >= target) {
        text += "  🎉 今日目标已完成！";
    } else {
        text += QString("  还差 %1 ml").arg(target - total);
    }
    m_labelWater->setText(text);

    m_listWater->clear();
    for (const WaterIntakeRecord& record : DatabaseManager::instance().getWaterRecords(today)) {
        QListWidgetItem* item = new QListWidgetItem(
            QString("%1  %2 ml").arg(record.time.toString(CLOCK_FORMAT)).arg(record.amount), m_listWater);
        item->setData(Qt::UserRole, record.id);
    }
}

void MainWindow::onWaterButtonClicked(int amount)
{
    WaterIntakeRecord record;
    record.id = generateUniqueId();
    record.time = QDateTime::currentDateTime();
    record.amount = amount;
    if (!DatabaseManager::instance().addWaterRecord(record)) {
        QMessageBox::critical(this, "错误", "饮水记录保存失败！");
        return;
    }
    refreshWater();
}

void MainWindow::onBtnDeleteWaterClicked()
{
    QListWidgetItem* item = m_listWater->currentItem();
    if (!item) {
        QMessageBox::warning(this, "提示", "请先选中要删除的记录！");
        return;
    }
    if (!DatabaseManager::instance().deleteWaterRecord(item->data(Qt::UserRole).toString())) {
        QMessageBox::critical(this, "错误", "删除失败！");
        return;
    }
    refreshWater();
}

void MainWindow::onBtnWaterStatisticClicked()
{
    WaterStatisticDialog dialog(m_config->get("water_reminder.daily_target", 1800).toInt(), this);
    dialog.exec();
}

void MainWindow::refreshActiveReminders()
{
    m_listReminders->clear();
    for (const ActiveReminder& reminder : m_engine->activeReminders()) {
        QString text = QString("[%1] %2\n%3")
                           .arg(reminder.lastShownAt.toString(CLOCK_FORMAT), reminder.displayTitle(),
                                truncateText(reminder.content, 60));
        if (reminder.state == ActiveReminder::State::Snoozed) {
            text += QString("\n（已稍后提醒 %1 次）").arg(reminder.snoozeCount);
        }
        QListWidgetItem* item = new QListWidgetItem(text, m_listReminders);
        item->setData(Qt::UserRole, reminder.id);
        if (reminder.priority == ReminderPriority::Urgent) {
            item->setForeground(Qt::red);
        }
    }
}

void MainWindow::onBtnSnoozeClicked()
{
    QListWidgetItem* item = m_listReminders->currentItem();
    if (!item) {
        QMessageBox::warning(this, "提示", "请先选中一条提醒！");
        return;
    }
    if (!m_engine->snooze(item->data(Qt::UserRole).toString())) {
        QMessageBox::information(this, "提示", "已达到最多稍后提醒次数，请处理这条提醒～");
    }
}

void MainWindow::onBtnDismissClicked()
{
    QListWidgetItem* item = m_listReminders->currentItem();
    if (!item) {
        QMessageBox::warning(this, "提示", "请先选中一条提醒！");
        return;
    }
    m_engine->dismiss(item->data(Qt::UserRole).toString());
}

void MainWindow::onAiModeChanged(int index)
{
    const QString mode = m_comboAiMode->itemData(index).toString();
    if (!m_config->set("ai_mode", mode)) {
        QMessageBox::critical(this, "错误", "配置保存失败！");
    }
}

void MainWindow::refreshCountdowns()
{
    m_listCountdowns->clear();
    const QDate today = QDate::currentDate();
    for (const Event& event : DatabaseManager::instance().getCountdownEvents()) {
        const int days = daysUntil(event.targetDate, today);
        if (days < 0) {
            continue;
        }
        new QListWidgetItem(QString("%1：%2").arg(event.title, EventTableModel::countdownText(days)),
                            m_listCountdowns);
    }
}

// ---------- 事件 ----------

QWidget* MainWindow::createEventTab()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);

    m_tableEvents = new QTableView(page);
    m_tableEvents->setModel(m_eventModel);
    m_tableEvents->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableEvents->setSelectionMode(QAbstractItemView::SingleSelection);
    QHeaderView* header = m_tableEvents->horizontalHeader();
    header->setSectionResizeMode(QHeaderView::ResizeToContents);
    header->setSectionResizeMode(0, QHeaderView::Stretch);
    layout->addWidget(m_tableEvents);

    QHBoxLayout* btnLayout = new QHBoxLayout();
    QPushButton* btnAdd = new QPushButton("添加", page);
    QPushButton* btnEdit = new QPushButton("编辑", page);
    QPushButton* btnDelete = new QPushButton("删除", page);
    btnLayout->addStretch();
    btnLayout->addWidget(btnAdd);
    btnLayout->addWidget(btnEdit);
    btnLayout->addWidget(btnDelete);
    layout->addLayout(btnLayout);

    // 药物
    QGroupBox* medicationGroup = new QGroupBox("💊 药物提醒", page);
    QVBoxLayout* medicationLayout = new QVBoxLayout(medicationGroup);
    m_listMedications = new QListWidget(medicationGroup);
    m_listMedications->setMaximumHeight(120);
    medicationLayout->addWidget(m_listMedications);
    QHBoxLayout* medicationBtnLayout = new QHBoxLayout();
    QPushButton* btnAddMedication = new QPushButton("添加药物", medicationGroup);
    QPushButton* btnDeleteMedication = new QPushButton("删除药物", medicationGroup);
    medicationBtnLayout->addStretch();
    medicationBtnLayout->addWidget(btnAddMedication);
    medicationBtnLayout->addWidget(btnDeleteMedication);
    medicationLayout->addLayout(medicationBtnLayout);
    layout->addWidget(medicationGroup);

    connect(btnAddMedication, &QPushButton::clicked, this, &MainWindow::onBtnAddMedicationClicked);
    connect(btnDeleteMedication, &QPushButton::clicked, this, &MainWindow::onBtnDeleteMedicationClicked);
    connect(btnAdd, &QPushButton::clicked, this, &MainWindow::onBtnAddEventClicked);
    connect(btnEdit, &QPushButton::clicked, this, &MainWindow::onBtnEditEventClicked);
    connect(btnDelete, &QPushButton::clicked, this, &MainWindow::onBtnDeleteEventClicked);
    connect(m_tableEvents, &QTableView::doubleClicked, this, &MainWindow::onBtnEditEventClicked);

    return page;
}

void MainWindow::refreshEvents()
{
    m_eventModel->refreshEvents();
    refreshCountdowns();
    refreshMedications();
}

void MainWindow::refreshMedications()
{
    m_listMedications->clear();
    for (const Medication& medication : DatabaseManager::instance().getMedications()) {
        QString text = QString("%1 %2  %3（%4）")
                           .arg(medication.name, medication.dosage, medication.times.join(" / "),
                                repeatTypeDisplayName(medication.cycle));
        if (medication.durationDays > 0) {
            text += QString("  共 %1 天").arg(medication.durationDays);
        }
        QListWidgetItem* item = new QListWidgetItem(text, m_listMedications);
        item->setData(Qt::UserRole, medication.id);
    }
}

bool MainWindow::showMedicationDialog(Medication &medication)
{
    QDialog dialog(this);
    dialog.setWindowTitle("添加药物");
    dialog.setModal(true);
    dialog.resize(360, 300);

    QFormLayout* layout = new QFormLayout(&dialog);

    QLineEdit* editName = new QLineEdit(&dialog);
    layout->addRow("药物名称：", editName);

    QLineEdit* editDosage = new QLineEdit(&dialog);
    editDosage->setPlaceholderText("如 1 片");
    layout->addRow("剂量：", editDosage);

    QLineEdit* editTimes = new QLineEdit("09:00", &dialog);
    editTimes->setPlaceholderText("多个时间用逗号分隔，如 09:00,21:00");
    layout->addRow("服药时间：", editTimes);

    QComboBox* comboCycle = new QComboBox(&dialog);
    for (RepeatType type : {RepeatType::Daily, RepeatType::Workdays, RepeatType::Weekly}) {
        comboCycle->addItem(repeatTypeDisplayName(type), repeatTypeToString(type));
    }
    layout->addRow("周期：", comboCycle);

    QDateEdit* dateStart = new QDateEdit(QDate::currentDate(), &dialog);
    dateStart->setCalendarPopup(true);
    layout->addRow("开始日期：", dateStart);

    QSpinBox* spinDuration = new QSpinBox(&dialog);
    spinDuration->setRange(0, 3650);
    spinDuration->setSpecialValueText("长期");
    layout->addRow("持续天数：", spinDuration);

    QLineEdit* editNotes = new QLineEdit(&dialog);
    layout->addRow("备注：", editNotes);

    QPushButton* btnOk = new QPushButton("确认", &dialog);
    QPushButton* btnCancel = new QPushButton("取消", &dialog);
    QHBoxLayout* btnLayout = new QHBoxLayout();
    btnLayout->addStretch();
    btnLayout->addWidget(btnOk);
    btnLayout->addWidget(btnCancel);
    layout->addRow(btnLayout);

    connect(btnOk, &QPushButton::clicked, &dialog, &QDialog::accept);
    connect(btnCancel, &QPushButton::clicked, &dialog, &QDialog::reject);

    if (dialog.exec() != QDialog::Accepted) {
        return false;
    }

    medication.name = editName->text().trimmed();
    if (medication.name.isEmpty()) {
        QMessageBox::warning(this, "提示", "药物名称不能为空！");
        return false;
    }

    medication.times.clear();
    for (const QString& item : editTimes->text().split(QRegularExpression("[,，\\s]+"), Qt::SkipEmptyParts)) {
        if (!parseClockTime(item).isValid()) {
            QMessageBox::warning(this, "提示", QString("时间格式错误：%1").arg(item));
            return false;
        }
        medication.times << formatClockTime(item);
    }
    if (medication.times.isEmpty()) {
        QMessageBox::warning(this, "提示", "请至少填写一个服药时间！");
        return false;
    }

    medication.id = generateUniqueId();
    medication.dosage = editDosage->text().trimmed();
    medication.cycle = repeatTypeFromString(comboCycle->currentData().toString(), RepeatType::Daily);
    medication.startDate = dateStart->date();
    medication.durationDays = spinDuration->value();
    medication.notes = editNotes->text().trimmed();
    medication.enabled = true;
    return true;
}

void MainWindow::onBtnAddMedicationClicked()
{
    Medication medication;
    if (!showMedicationDialog(medication)) {
        return;
    }
    if (!DatabaseManager::instance().addMedication(medication)) {
        QMessageBox::critical(this, "错误", "药物添加失败！");
        return;
    }
    m_engine->reloadMedicationReminders();
    refreshMedications();
}

void MainWindow::onBtnDeleteMedicationClicked()
{
    QListWidgetItem* item = m_listMedications->currentItem();
    if (!item) {
        QMessageBox::warning(this, "提示", "请先选中要删除的药物！");
        return;
    }
    if (!DatabaseManager::instance().deleteMedication(item->data(Qt::UserRole).toString())) {
        QMessageBox::critical(this, "错误", "药物删除失败！");
        return;
    }
    m_engine->reloadMedicationReminders();
    refreshMedications();
}

void MainWindow::onBtnAddEventClicked()
{
    AddEventDialog dialog(Event(), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    const Event event = dialog.editedEvent();
    if (!DatabaseManager::instance().addEvent(event)) {
        QMessageBox::critical(this, "错误", "事件添加失败！");
        return;
    }
    m_engine->updateEventReminder(event);
    refreshEvents();
}

void MainWindow::onBtnEditEventClicked()
{
    const QModelIndex index = m_tableEvents->currentIndex();
    if (!index.isValid()) {
        QMessageBox::warning(this, "提示", "请先选中要编辑的事件！");
        return;
    }

    AddEventDialog dialog(m_eventModel->getEventAt(index.row()), this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    const Event event = dialog.editedEvent();
    if (!DatabaseManager::instance().updateEvent(event)) {
        QMessageBox::critical(this, "错误", "事件修改失败！");
        return;
    }
    m_engine->updateEventReminder(event);
    refreshEvents();
}

void MainWindow::onBtnDeleteEventClicked()
{
    const QModelIndex index = m_tableEvents->currentIndex();
    if (!index.isValid()) {
        QMessageBox::warning(this, "提示", "请先选中要删除的事件！");
        return;
    }

    const Event event = m_eventModel->getEventAt(index.row());
    if (QMessageBox::question(this, "确认删除", QString("确定要删除“%1”吗？").arg(event.title))
        != QMessageBox::Yes) {
        return;
    }
    if (!DatabaseManager::instance().deleteEvent(event.id)) {
        QMessageBox::critical(this, "错误", "事件删除失败！");
        return;
    }
    m_engine->removeEventReminder(event.id);
    refreshEvents();
}

// ---------- 孕期 ----------

QWidget* MainWindow::createPregnancyTab()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);

    const PregnancyConfig pregnancy = m_config->pregnancyConfig();

    QGroupBox* settingGroup = new QGroupBox("孕期设置", page);
    QFormLayout* formLayout = new QFormLayout(settingGroup);
    m_checkPregnancy = new QCheckBox("开启孕期模式", settingGroup);
    m_checkPregnancy->setChecked(pregnancy.enabled);
    formLayout->addRow("", m_checkPregnancy);
    m_dateLastPeriod = new QDateEdit(settingGroup);
    m_dateLastPeriod->setCalendarPopup(true);
    m_dateLastPeriod->setMaximumDate(QDate::currentDate());
    m_dateLastPeriod->setDate(pregnancy.lastPeriodDate.isValid() ? pregnancy.lastPeriodDate
                                                                 : QDate::currentDate().addDays(-28));
    formLayout->addRow("末次月经：", m_dateLastPeriod);
    QPushButton* btnSave = new QPushButton("保存", settingGroup);
    formLayout->addRow("", btnSave);
    layout->addWidget(settingGroup);

    m_labelWeekInfo = new QLabel(page);
    m_labelWeekInfo->setWordWrap(true);
    layout->addWidget(m_labelWeekInfo);

    QGroupBox* tipsGroup = new QGroupBox("今日建议", page);
    QVBoxLayout* tipsLayout = new QVBoxLayout(tipsGroup);
    m_textTips = new QTextEdit(tipsGroup);
    m_textTips->setReadOnly(true);
    tipsLayout->addWidget(m_textTips);
    QPushButton* btnRefreshTips = new QPushButton("获取今日建议", tipsGroup);
    tipsLayout->addWidget(btnRefreshTips, 0, Qt::AlignRight);
    layout->addWidget(tipsGroup, 1);

    QGroupBox* fetalGroup = new QGroupBox("👶 胎动计数", page);
    QHBoxLayout* fetalLayout = new QHBoxLayout(fetalGroup);
    m_labelFetal = new QLabel(fetalGroup);
    m_btnFetalStart = new QPushButton("开始计数", fetalGroup);
    m_btnFetalCount = new QPushButton("动了 +1", fetalGroup);
    m_btnFetalEnd = new QPushButton("结束", fetalGroup);
    fetalLayout->addWidget(m_labelFetal, 1);
    fetalLayout->addWidget(m_btnFetalStart);
    fetalLayout->addWidget(m_btnFetalCount);
    fetalLayout->addWidget(m_btnFetalEnd);
    layout->addWidget(fetalGroup);

    connect(btnSave, &QPushButton::clicked, this, &MainWindow::onBtnSavePregnancyClicked);
    connect(btnRefreshTips, &QPushButton::clicked, this, &MainWindow::onBtnRefreshTipsClicked);
    connect(m_btnFetalStart, &QPushButton::clicked, this, &MainWindow::onBtnFetalStartClicked);
    connect(m_btnFetalCount, &QPushButton::clicked, this, &MainWindow::onBtnFetalCountClicked);
    connect(m_btnFetalEnd, &QPushButton::clicked, this, &MainWindow::onBtnFetalEndClicked);

    return page;
}

int MainWindow::pregnancyWeek() const
{
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    if (!pregnancy.enabled) {
        return 0;
    }
    return qMax(0, PregnancyCalculator(pregnancy).currentWeek());
}

void MainWindow::refreshPregnancyInfo()
{
    const PregnancyConfig pregnancy = m_config->pregnancyConfig();
    if (!pregnancy.enabled || !pregnancy.lastPeriodDate.isValid()) {
        m_labelWeekInfo->setText("尚未开启孕期模式");
        m_textTips->clear();
        return;
    }

    const PregnancyWeekInfo info = PregnancyCalculator(pregnancy).weekInfo();
    m_labelWeekInfo->setText(QString("当前孕周：%1（%2）\n预产期：%3，还有 %4 天\n%5")
                                 .arg(info.display, info.trimesterName,
                                      formatDate(info.dueDate, true))
                                 .arg(info.daysUntilDue)
                                 .arg(PregnancyCalculator::babyDevelopmentStage(info.week)));
}

void MainWindow::onBtnSavePregnancyClicked()
{
    PregnancyConfig pregnancy = m_config->pregnancyConfig();
    pregnancy.enabled = m_checkPregnancy->isChecked();
    pregnancy.lastPeriodDate = m_dateLastPeriod->date();
    if (!m_config->setPregnancyConfig(pregnancy)) {
        QMessageBox::critical(this, "错误", "孕期设置保存失败！");
        return;
    }
    // 孕周变化会影响胎动和每日建议任务
    m_engine->reloadAll();
    refreshPregnancyInfo();
    refreshFetalMovement();
}

QString MainWindow::formatFullTips(const QJsonObject& tips)
{
    struct Section {
        const char* key;
        const char* label;
    };
    static const Section sections[] = {
        {"precautions", "📌 注意事项"},
        {"activities", "🌸 今日可做"},
        {"diet_tips", "🥗 饮食建议"},
        {"exercise", "🚶 运动建议"},
        {"mood", "😊 情绪调节"},
        {"baby_update", "👶 宝宝发育"},
    };

    QStringList lines;
    for (const Section& section : sections) {
        const QString text = tips.value(QLatin1String(section.key)).toString();
        if (!text.isEmpty()) {
            lines << QString("%1：%2").arg(QString::fromUtf8(section.label), text);
        }
    }
    return lines.join("\n\n");
}

void MainWindow::onBtnRefreshTipsClicked()
{
    const int week = pregnancyWeek();
    if (week <= 0) {
        QMessageBox::information(this, "提示", "请先开启孕期模式并设置末次月经日期～");
        return;
    }

    m_textTips->setPlainText("正在生成今日建议…");
    QPointer<MainWindow> guard(this);
    m_tipsGenerator->requestDailyTips(week, [guard](const QJsonObject& tips) {
        if (guard) {
            guard->m_textTips->setPlainText(formatFullTips(tips));
        }
    });
}

void MainWindow::refreshFetalMovement()
{
    const bool active = m_fetalSession.startTime.isValid();
    m_btnFetalStart->setEnabled(!active && pregnancyWeek() > 0);
    m_btnFetalCount->setEnabled(active);
    m_btnFetalEnd->setEnabled(active);

    if (active) {
        m_labelFetal->setText(QString("计数中（%1 开始）：%2 次")
                                  .arg(m_fetalSession.startTime.toString(CLOCK_FORMAT))
                                  .arg(m_fetalSession.count));
        return;
    }

    int todayCount = 0;
    const QList<FetalMovementRecord> records = DatabaseManager::instance().getFetalMovements(QDate::currentDate());
    for (const FetalMovementRecord& record : records) {
        todayCount += record.count;
    }
    m_labelFetal->setText(QString("今日已记录 %1 次，共 %2 次胎动").arg(records.size()).arg(todayCount));
}

void MainWindow::onBtnFetalStartClicked()
{
    m_fetalSession = FetalMovementRecord();
    m_fetalSession.id = generateUniqueId();
    m_fetalSession.date = QDate::currentDate();
    m_fetalSession.startTime = QDateTime::currentDateTime();
    if (!DatabaseManager::instance().addFetalMovement(m_fetalSession)) {
        QMessageBox::critical(this, "错误", "胎动记录创建失败！");
        m_fetalSession = FetalMovementRecord();
    }
    refreshFetalMovement();
}

void MainWindow::onBtnFetalCountClicked()
{
    m_fetalSession.count++;
    refreshFetalMovement();
}

void MainWindow::onBtnFetalEndClicked()
{
    m_fetalSession.endTime = QDateTime::currentDateTime();
    if (!DatabaseManager::instance().updateFetalMovement(m_fetalSession)) {
        QMessageBox::critical(this, "错误", "胎动记录保存失败！");
        return;
    }
    const int count = m_fetalSession.count;
    m_fetalSession = FetalMovementRecord();
    refreshFetalMovement();
    QMessageBox::information(this, "胎动计数", QString("本次共记录 %1 次胎动～").arg(count));
}

// ---------- 饮食 ----------

QWidget* MainWindow::createDietTab()
{
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);

    QGroupBox* mealGroup = new QGroupBox(QString("今日饮食（%1）").arg(formatDate(QDate::currentDate(), true)), page);
    QVBoxLayout* mealLayout = new QVBoxLayout(mealGroup);
    m_textMeals = new QTextEdit(mealGroup);
    m_textMeals->setReadOnly(true);
    mealLayout->addWidget(m_textMeals);
    layout->addWidget(mealGroup, 1);

    QGroupBox* analysisGroup = new QGroupBox("营养分析", page);
    QVBoxLayout* analysisLayout = new QVBoxLayout(analysisGroup);
    m_textAnalysis = new QTextEdit(analysisGroup);
    m_textAnalysis->setReadOnly(true);
    analysisLayout->addWidget(m_textAnalysis);
    layout->addWidget(analysisGroup, 1);

    QHBoxLayout* btnLayout = new QHBoxLayout();
    QPushButton* btnRecord = new QPushButton("记录饮食", page);
    m_btnAnalyze = new QPushButton("分析今日饮食", page);
    btnLayout->addStretch();
    btnLayout->addWidget(btnRecord);
    btnLayout->addWidget(m_btnAnalyze);
    layout->addLayout(btnLayout);

    connect(btnRecord, &QPushButton::clicked, this, &MainWindow::onBtnRecordMealClicked);
    connect(m_btnAnalyze, &QPushButton::clicked, this, &MainWindow::onBtnAnalyzeDietClicked);

    return page;
}

void MainWindow::refreshDiet()
{
    const DietRecord record = DatabaseManager::instance().getDietRecord(QDate::currentDate());
    QStringList lines;
    for (const MealRecord& meal : record.meals) {
        lines << QString("%1 %2：%3").arg(meal.time, mealTypeDisplayName(meal.type), meal.foods.join("、"));
    }
    m_textMeals->setPlainText(lines.isEmpty() ? QString("今天还没有记录饮食哦～") : lines.join("\n"));
    m_textAnalysis->setPlainText(record.hasAnalysis() ? DietAnalyzer::formatAnalysis(record.analysis) : QString());
}

void MainWindow::onBtnRecordMealClicked()
{
    DietRecordDialog dialog(m_dietAnalyzer, QDate::currentDate(), this);
    if (dialog.exec() == QDialog::Accepted) {
        refreshDiet();
    }
}

void MainWindow::onBtnAnalyzeDietClicked()
{
    m_btnAnalyze->setEnabled(false);
    m_textAnalysis->setPlainText("正在分析…");

    QPointer<MainWindow> guard(this);
    m_dietAnalyzer->analyze(QDate::currentDate(), [guard](const DietAnalyzer::Result& result) {
        if (!guard) {
            return;
        }
        guard->m_btnAnalyze->setEnabled(true);
        if (!result.success) {
            guard->m_textAnalysis->setPlainText(result.errorMessage);
            return;
        }
        guard->m_textAnalysis->setPlainText(DietAnalyzer::formatAnalysis(result.analysis));
    }, pregnancyWeek() > 0 ? pregnancyWeek() : -1);
}

// ---------- 窗口 ----------

void MainWindow::showAndRaise()
{
    showNormal();
    raise();
    activateWindow();
}

void MainWindow::showActiveReminders()
{
    showAndRaise();
    m_tabWidget->setCurrentIndex(0);
    refreshActiveReminders();
    if (m_listReminders->count() > 0) {
        m_listReminders->setCurrentRow(0);
    }
    m_listReminders->setFocus();
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // 后台继续提醒
    hide();
    event->ignore();
}
