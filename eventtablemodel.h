#ifndef EVENTTABLEMODEL_H
#define EVENTTABLEMODEL_H

#include <QAbstractTableModel>
#include <QDate>
#include <QList>
#include "models.h"

// 事件与倒计时列表
class EventTableModel : public QAbstractTableModel
{
    Q_OBJECT
public:
    explicit EventTableModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    void setEventList(const QList<Event> &eventList);
    // 从数据库重新加载
    void refreshEvents();
    Event getEventAt(int row) const;

    // 计算天数时使用的“今天”，无效时使用当前日期
    void setToday(const QDate &today) { m_today = today; }

    // 倒计时文字：“还有 N 天” / “就是今天” / “已过 N 天”
    static QString countdownText(int days);

private:
    QDate today() const;

    QList<Event> m_eventList;
    QDate m_today;
};

#endif // EVENTTABLEMODEL_H
