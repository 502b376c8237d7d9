#pragma once

#include <QDate>

namespace pawpal {
namespace data {

class Owner;

// Adds a dog and a cat with a typical day of care tasks due on today.
void seedDemoHousehold(Owner &owner, const QDate &today);

} // namespace data
} // namespace pawpal
