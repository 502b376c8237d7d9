#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <vector>

namespace pawpal {
namespace data {
struct CareTask;
}

namespace core {

class Scheduler;

// Result of one planning request. Task pointers refer into the owner the
// plan was generated from and stay valid while that owner is alive.
class Schedule
{
public:
    Schedule(const QDate &date, int budgetMinutes);

    const QDate &date() const;
    const std::vector<const data::CareTask *> &tasks() const;
    int totalMinutes() const;
    int budgetMinutes() const;
    int remainingMinutes() const;
    bool isEmpty() const;
    bool contains(const QUuid &taskId) const;

    const QStringList &rationale() const;
    const QStringList &skippedTaskNames() const;

    QString summary() const;
    QString toText() const;

private:
    friend class Scheduler;

    void accept(const data::CareTask &task, const QString &reason);
    void skip(const data::CareTask &task, const QString &reason);

    QDate m_date;
    int m_budgetMinutes = 0;
    int m_totalMinutes = 0;
    std::vector<const data::CareTask *> m_tasks;
    QStringList m_rationale;
    QStringList m_skipped;
};

} // namespace core
} // namespace pawpal
