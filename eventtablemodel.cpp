#include "eventtablemodel.h"
#include "databasemanager.h"
#include "helpers.h"
#include <QBrush>
#include <QColor>

EventTableModel::EventTableModel(QObject *parent)
    : QAbstractTableModel(parent)
{
}

int EventTableModel::rowCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent);
    return m_eventList.count();
}

int EventTableModel::columnCount(const QModelIndex &parent) const
{
    Q_UNUSED(parent);
    return 5;
}

QDate EventTableModel::today() const
{
    return m_today.isValid() ? m_today : QDate::currentDate();
}

QString EventTableModel::countdownText(int days)
{
    if (days > 0) {
        return QString("还有 %1 天").arg(days);
    } else if (days == 0) {
        return "就是今天";
    }
    return QString("已过 %1 天").arg(-days);
}

QVariant EventTableModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_eventList.count()) {
        return QVariant();
    }

    const Event& event = m_eventList.at(index.row());
    const bool hasTarget = event.isCountdown && event.targetDate.isValid();
    const int days = hasTarget ? daysUntil(event.targetDate, today()) : 0;

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
        case 0: return event.title;
        case 1: return event.isCountdown ? "倒计时" : "提醒";
        case 2:
            if (event.isCountdown) {
                return event.targetDate.toString(DATE_FORMAT);
            }
            return event.remindTime.isValid() ? event.remindTime.toString("yyyy-MM-dd HH:mm") : QString("不提醒");
        case 3: return repeatTypeDisplayName(event.repeatType);
        case 4:
            if (hasTarget) {
                return countdownText(days);
            }
            return event.enabled ? "已启用" : "已停用";
        default: return QVariant();
        }
    }

    // 倒计时列颜色：7 天内红色，30 天内橙色，已过灰色
    if (role == Qt::ForegroundRole && index.column() == 4 && hasTarget) {
        if (days < 0) {
            return QBrush(Qt::gray);
        } else if (days <= 7) {
            return QBrush(Qt::red);
        } else if (days <= 30) {
            return QBrush(QColor(255, 140, 0));
        }
        return QBrush(Qt::darkGreen);
    }

    if (!event.enabled && role == Qt::ForegroundRole) {
        return QBrush(Qt::gray);
    }

    // 当天的倒计时整行高亮
    if (hasTarget && days == 0 && role == Qt::BackgroundRole) {
        return QBrush(QColor(255, 228, 240));
    }

    return QVariant();
}

QVariant EventTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
        case 0: return "标题";
        case 1: return "类型";
        case 2: return "时间";
        case 3: return "重复";
        case 4: return "状态";
        default: return QVariant();
        }
    }
    return QVariant();
}

void EventTableModel::setEventList(const QList<Event> &eventList)
{
    beginResetModel();
    m_eventList = eventList;
    endResetModel();
}

void EventTableModel::refreshEvents()
{
    setEventList(DatabaseManager::instance().getEvents());
}

Event EventTableModel::getEventAt(int row) const
{
    if (row >= 0 && row < m_eventList.count()) {
        return m_eventList.at(row);
    }
    return Event();
}
