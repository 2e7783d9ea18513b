#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <QString>
#include <QStringList>
#include <QJsonObject>

// 应用信息
const QString APP_NAME = "DrinkWater";
const QString APP_VERSION = "1.0.0";
const QString APP_ORGANIZATION = "DrinkWater Team";

// 数据文件名（位于用户数据目录下）
const QString CONFIG_FILE_NAME = "config.json";
const QString LLM_CONFIG_FILE_NAME = "llm_config.json";
const QString DATABASE_FILE_NAME = "drinkwater.db";

// 统一的日期时间存储格式
const QString DATETIME_FORMAT = "yyyy-MM-dd HH:mm:ss";
const QString DATE_FORMAT = "yyyy-MM-dd";
const QString CLOCK_FORMAT = "HH:mm";

const QString DEFAULT_THEME = "hello_kitty";

// 提醒优先级（数值越小越紧急）
enum class ReminderPriority {
    Urgent = 0,     // 紧急（药物、产检）
    Important = 1,  // 重要（胎动记录、营养补充）
    Normal = 2,     // 常规（喝水、站立、眼睛休息）
    Suggested = 3   // 建议（情绪放松、姿势调整）
};

// AI 模式：每种模式允许用 AI 生成的内容类型和每日调用上限
struct AiModeOption {
    QString name;
    QString desc;
    QStringList aiTypes;
    int maxCalls = 0;
};

// 用户数据目录（Windows: %APPDATA%/DrinkWater，Mac: ~/Library/Application Support/DrinkWater）
QString userDataDir();
// 随程序发布的资源目录（Mac: Contents/Resources，其他平台: 可执行文件旁的 resources）
QString resourcesDir();

// 默认配置（加载时与用户配置递归合并）
QJsonObject defaultConfig();

// 降级模板，key 为内容类型（water、stand_up ...）
QString fallbackTemplate(const QString& contentType);

// 未知模式按 smart 处理
AiModeOption aiModeOption(const QString& mode);
QStringList aiModeNames();

#endif // CONSTANTS_H
