#include "AppSettings.hpp"

#include <QLoggingCategory>
#include <QSettings>

Q_DECLARE_LOGGING_CATEGORY(scApp)

namespace {

sroscli::KnownHostsPolicy policyFromInt(int v) {
    switch (v) {
    case static_cast<int>(sroscli::KnownHostsPolicy::AcceptNew):
        return sroscli::KnownHostsPolicy::AcceptNew;
    case static_cast<int>(sroscli::KnownHostsPolicy::Off):
        return sroscli::KnownHostsPolicy::Off;
    default:
        return sroscli::KnownHostsPolicy::Strict;
    }
}

} // namespace

QVector<SiteEntry> loadSavedSites() {
    QVector<SiteEntry> sites;
    QSettings s("SrosCli", "SrosCli");
    const int n = s.beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        SiteEntry e;
        e.name = s.value("name").toString().trimmed();
        e.opt.host = s.value("host").toString().trimmed().toStdString();
        e.opt.port = static_cast<std::uint16_t>(s.value("port", 22).toUInt());
        e.opt.username = s.value("user").toString().toStdString();
        const QString kp = s.value("keyPath").toString();
        if (!kp.isEmpty())
            e.opt.private_key_path = kp.toStdString();
        const QString kh = s.value("knownHosts").toString();
        if (!kh.isEmpty())
            e.opt.known_hosts_path = kh.toStdString();
        e.opt.known_hosts_policy = policyFromInt(
            s.value("khPolicy", static_cast<int>(sroscli::KnownHostsPolicy::Strict)).toInt());
        if (e.name.isEmpty() || e.opt.host.empty()) {
            qWarning(scApp) << "Ignoring saved site" << i << "without name or host";
            continue;
        }
        sites.push_back(e);
    }
    s.endArray();
    return sites;
}

bool findSavedSite(const QString &name, SiteEntry &out) {
    for (const SiteEntry &e : loadSavedSites()) {
        if (e.name == name) {
            out = e;
            return true;
        }
    }
    return false;
}

AdvancedSettings loadAdvancedSettings() {
    AdvancedSettings a;
    QSettings s("SrosCli", "SrosCli");
    a.tuning.global_delay_factor =
        s.value("Advanced/globalDelayFactor", a.tuning.global_delay_factor).toDouble();
    a.tuning.cmd_verify = s.value("Advanced/cmdVerify", a.tuning.cmd_verify).toBool();
    a.tuning.read_timeout_ms =
        s.value("Advanced/readTimeoutMs", a.tuning.read_timeout_ms).toInt();
    a.exitConfigMaxAttempts =
        s.value("Advanced/exitConfigMaxAttempts", a.exitConfigMaxAttempts).toInt();
    a.fileSystem = s.value("Advanced/fileSystem", a.fileSystem).toString().trimmed();

    // Clamp values edited by hand
    if (a.tuning.global_delay_factor < 0.0)
        a.tuning.global_delay_factor = 1.0;
    if (a.tuning.read_timeout_ms < 100)
        a.tuning.read_timeout_ms = 100;
    if (a.exitConfigMaxAttempts < 1)
        a.exitConfigMaxAttempts = 1;
    if (a.fileSystem.isEmpty())
        a.fileSystem = QStringLiteral("cf3:");
    return a;
}
