#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <vector>

namespace im::test {

QString fixturesDir();
QString artifactFixtureDir();
QString vocabFixturePath();

bool writeJsonFile(const QString& path, const QJsonObject& obj);

// Two questions over "Tech", "Arts" and "Sports", plus one option without an area.
std::vector<Question> sampleCatalog();

} // namespace im::test
