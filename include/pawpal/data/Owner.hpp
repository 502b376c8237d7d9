#pragma once

#include <QString>
#include <QUuid>
#include <QVariant>
#include <QVariantMap>
#include <memory>
#include <optional>
#include <vector>

#include "pawpal/data/CareTask.hpp"

namespace pawpal {
namespace data {

class Pet;

class Owner
{
public:
    Owner(QString name, int availableMinutes);
    ~Owner();

    Owner(const Owner &) = delete;
    Owner &operator=(const Owner &) = delete;

    const QUuid &id() const;
    const QString &name() const;
    int availableMinutes() const;
    void setAvailableMinutes(int minutes);

    // Free-form settings such as a preferred walk time; the planner does not read them.
    const QVariantMap &preferences() const;
    void setPreference(const QString &key, const QVariant &value);

    Pet &addPet(QString name, QString species, int age = 0, QString specialNeeds = QString());
    std::vector<const Pet *> pets() const;
    Pet *findPet(const QUuid &petId);
    const Pet *findPet(const QUuid &petId) const;
    QString petName(const QUuid &petId) const;

    // All pets' tasks concatenated in pet order, then insertion order.
    std::vector<const CareTask *> allTasks() const;
    std::vector<const CareTask *> incompleteTasks() const;
    const CareTask *findTask(const QUuid &taskId) const;

    // Rejects a task whose id is already held by any of this owner's pets.
    bool appendTask(const QUuid &petId, CareTask task);

    // Routes completion to the owning pet, which appends the next occurrence.
    std::optional<CareTask> completeTask(const QUuid &taskId);

    QString description() const;

private:
    QUuid m_id = QUuid::createUuid();
    QString m_name;
    int m_availableMinutes = 0;
    QVariantMap m_preferences;
    std::vector<std::unique_ptr<Pet>> m_pets;
};

} // namespace data
} // namespace pawpal
