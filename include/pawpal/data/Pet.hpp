#pragma once

#include <QString>
#include <QUuid>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "pawpal/data/CareTask.hpp"

namespace pawpal {
namespace data {

class Pet
{
public:
    Pet(QString name, QString species, int age = 0, QString specialNeeds = QString());
    ~Pet();

    Pet(const Pet &) = delete;
    Pet &operator=(const Pet &) = delete;

    const QUuid &id() const;
    const QString &name() const;
    const QString &species() const;
    int age() const;
    const QString &specialNeeds() const;

    // Takes ownership and stamps this pet's id on the task. Invalid tasks and
    // duplicate ids are rejected.
    bool addTask(CareTask task);

    std::vector<const CareTask *> tasks() const;
    std::vector<const CareTask *> incompleteTasks() const;
    const CareTask *findTask(const QUuid &taskId) const;
    std::size_t taskCount() const;

    // Completes the task and appends its next occurrence, if any.
    std::optional<CareTask> completeTask(const QUuid &taskId);

    QString description() const;

private:
    CareTask *findMutableTask(const QUuid &taskId);

    QUuid m_id = QUuid::createUuid();
    QString m_name;
    QString m_species;
    int m_age = 0;
    QString m_specialNeeds;
    std::vector<std::unique_ptr<CareTask>> m_tasks;
};

} // namespace data
} // namespace pawpal
