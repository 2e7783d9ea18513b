#include "constants.h"
#include <QStandardPaths>
#include <QDir>
#include <QCoreApplication>
#include <QJsonArray>
#include <QMap>

QString userDataDir()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty()) {
        dir = QDir::homePath() + "/." + APP_NAME;
    }
    QDir().mkpath(dir);
    return dir;
}

QString resourcesDir()
{
    QDir dir(QCoreApplication::applicationDirPath());
#ifdef Q_OS_MACOS
    if (dir.cd("../Resources")) {
        return dir.absolutePath();
    }
#endif
    return dir.absoluteFilePath("resources");
}

QJsonObject defaultConfig()
{
    QJsonObject water {
        {"enabled", true},
        {"interval_minutes", 45},
        {"start_time", "09:00"},
        {"end_time", "18:00"},
        {"daily_target", 1800}
    };

    QJsonObject pregnancy {
        {"enabled", false},
        {"last_period_date", QJsonValue::Null},
        {"daily_tip_time", "09:00"}
    };

    QJsonObject workplace {
        {"stand_up", QJsonObject {
             {"enabled", true},
             {"interval_minutes", 45},
             {"work_hours", QJsonObject {{"start", "09:00"}, {"end", "18:00"}}},
             {"exclude_lunch", true}
         }},
        {"eye_rest", QJsonObject {
             {"enabled", true},
             {"interval_minutes", 20}
         }},
        {"nutrition", QJsonObject {
             {"enabled", true},
             {"snacks", QJsonArray {
                  QJsonObject {{"time", "10:00"}, {"name", "上午加餐"}},
                  QJsonObject {{"time", "15:00"}, {"name", "下午茶"}}
              }}
         }},
        {"medication", QJsonObject {
             {"items", QJsonArray()}
         }},
        {"posture", QJsonObject {
             {"enabled", true},
             {"interval_minutes", 30}
         }},
        {"relaxation", QJsonObject {
             {"enabled", true},
             {"times", QJsonArray {"10:30", "16:00"}}
         }},
        {"fetal_movement", QJsonObject {
             {"enabled", false},
             {"enable_week", 18},
             {"times", QJsonArray {"09:00", "14:00", "20:00"}}
         }},
        {"nap", QJsonObject {
             {"enabled", true},
             {"time", "12:30"},
             {"duration_minutes", 30}
         }}
    };

    QJsonObject notifications {
        {"sound", true},
        {"popup", true},
        {"duration_seconds", 5}
    };

    // 提醒引擎：稍后提醒、升级提醒、错过判定
    QJsonObject engine {
        {"snooze_minutes", 10},
        {"max_snooze_count", 3},
        {"max_escalations", 3},
        {"escalation_minutes", QJsonObject {{"urgent", 5}, {"important", 15}}},
        {"misfire_grace_seconds", 60}
    };

    return QJsonObject {
        {"autostart", false},
        {"theme", DEFAULT_THEME},
        {"language", "zh_CN"},
        {"water_reminder", water},
        {"pregnancy", pregnancy},
        {"workplace_reminders", workplace},
        {"ai_mode", "smart"},
        {"notifications", notifications},
        {"reminder_engine", engine}
    };
}

QString fallbackTemplate(const QString& contentType)
{
    static const QMap<QString, QString> templates {
        {"nutrition", "🍎 加餐时间到！建议：坚果 10 颗 / 水果 1 份 / 酸奶 1 杯"},
        {"relaxation", "🧘‍♀️ 深呼吸 5 次，闭目 1 分钟，放松身心～"},
        {"stand_up", "💃 起来活动 3-5 分钟，绕办公室走走，促进血液循环～"},
        {"posture", "🪑 检查坐姿：背挺直，脚平放，腰垫靠垫，别跷腿～"},
        {"daily_tips", "💝 今日提示：多喝水，适度活动，保持好心情，按时产检～"},
        {"water", "💧 该喝水啦！保持水分摄入，对你和宝宝都很重要～"},
        {"eye_rest", "👀 眼睛休息时间！看看远处，眨眨眼，做做眼保健操～"},
        {"medication", "💊 吃药时间到！记得按时服用哦～"},
        {"nap", "😴 午休时间到！休息 30 分钟，恢复精力～"},
        {"fetal_movement", "👶 记录胎动时间！安静下来感受宝宝的活动～"}
    };
    return templates.value(contentType);
}

AiModeOption aiModeOption(const QString& mode)
{
    if (mode == "full") {
        return {"完全 AI", "所有提醒都用 AI 生成",
                {"daily_tips", "nutrition", "posture", "stand_up", "relaxation"}, 10};
    }
    if (mode == "minimal") {
        return {"节约模式", "仅每日建议用 AI", {"daily_tips"}, 1};
    }
    if (mode == "off") {
        return {"关闭 AI", "全部使用固定模板", {}, 0};
    }
    return {"智能模式（推荐）", "重要提醒用 AI，其他用模板",
            {"daily_tips", "nutrition", "posture"}, 5};
}

QStringList aiModeNames()
{
    return {"smart", "full", "minimal", "off"};
}
