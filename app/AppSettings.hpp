// Persistent driver settings: saved sites and tuning knobs.
#pragma once
#include "sroscli/SessionTypes.hpp"
#include <QString>
#include <QVector>

struct SiteEntry {
    QString name;
    sroscli::SessionOptions opt;
};

struct AdvancedSettings {
    sroscli::ChannelTuning tuning;
    int exitConfigMaxAttempts = 2;
    QString fileSystem = QStringLiteral("cf3:");
};

QVector<SiteEntry> loadSavedSites();
// Case-sensitive lookup by name; false when absent.
bool findSavedSite(const QString &name, SiteEntry &out);
AdvancedSettings loadAdvancedSettings();
