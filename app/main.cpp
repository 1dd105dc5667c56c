// sroscli: run configuration and show commands against an SR OS node over
// SSH, optionally commit/save and verify transferred files by size.
#include "AppSettings.hpp"
#include "sroscli/CliSession.hpp"
#include "sroscli/Libssh2Channel.hpp"
#include "sroscli/TransferVerifier.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>
#include <QTextStream>

#include <iostream>
#include <string>
#include <vector>

Q_LOGGING_CATEGORY(scApp, "sroscli.app")

namespace {

struct Action {
    QStringList configLines;
    bool commit = false;
    bool save = false;
    QStringList commands;
    QStringList verifyPut;
    QStringList verifyGet;
};

bool readConfigFile(const QString &path, QStringList &lines, QString &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        err = QStringLiteral("Cannot open %1: %2").arg(path, f.errorString());
        return false;
    }
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        const QString t = line.trimmed();
        if (t.isEmpty() || t.startsWith('#'))
            continue;
        lines << line;
    }
    return true;
}

// "A=B" -> (A, B); both halves required
bool splitPair(const QString &value, QString &first, QString &second) {
    const int eq = value.indexOf('=');
    if (eq <= 0 || eq == value.size() - 1)
        return false;
    first = value.left(eq);
    second = value.mid(eq + 1);
    return true;
}

bool askYesNo(const std::string &question) {
    std::cerr << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

void reportError(const char *what, const sroscli::CliError &err) {
    qCritical(scApp) << what << "failed:" << sroscli::cliErrorKindName(err.kind)
                     << err.message.c_str();
    std::cerr << what << ": " << sroscli::cliErrorKindName(err.kind) << ": "
              << err.message << "\n";
}

void printOutput(const std::string &out) {
    if (out.empty())
        return;
    std::cout << out;
    if (out.back() != '\n')
        std::cout << "\n";
}

bool runVerify(sroscli::CliSession &session, sroscli::TransferDirection dir,
               const QString &pair, const QString &fileSystem) {
    sroscli::TransferSpec spec;
    spec.direction = dir;
    spec.file_system = fileSystem.toStdString();
    QString src, dst;
    if (!splitPair(pair, src, dst)) {
        std::cerr << "Invalid transfer pair (expected SOURCE=DEST): "
                  << pair.toStdString() << "\n";
        return false;
    }
    spec.source_file = src.toStdString();
    spec.dest_file = dst.toStdString();

    sroscli::TransferVerifier verifier(session, spec);
    sroscli::CliError err;
    bool exists = false;
    if (!verifier.checkFileExists(exists, err)) {
        reportError("check file exists", err);
        return false;
    }
    if (!exists) {
        std::cerr << "Destination file not found: " << spec.dest_file << "\n";
        return false;
    }
    bool match = false;
    if (!verifier.compareChecksum(match, err)) {
        reportError("verify file", err);
        return false;
    }
    std::cout << (match ? "[OK] " : "[MISMATCH] ") << spec.source_file << " -> "
              << spec.dest_file << "\n";
    return match;
}

bool runActions(sroscli::CliSession &session, const Action &a, const QString &fileSystem) {
    sroscli::CliError err;
    std::string out;

    if (!a.configLines.isEmpty()) {
        std::vector<std::string> cmds;
        cmds.reserve(static_cast<std::size_t>(a.configLines.size()));
        for (const QString &l : a.configLines)
            cmds.push_back(l.toStdString());
        if (!session.sendConfigSet(cmds, out, err)) {
            reportError("send config set", err);
            return false;
        }
        printOutput(out);
    }
    if (a.commit) {
        if (!session.commit(out, err)) {
            reportError("commit", err);
            return false;
        }
        printOutput(out);
    }
    for (const QString &c : a.commands) {
        if (!session.sendCommand(c.toStdString(), out, err)) {
            reportError("send command", err);
            return false;
        }
        printOutput(out);
    }
    if (a.save) {
        if (!session.saveConfig(out, err)) {
            reportError("save config", err);
            return false;
        }
        printOutput(out);
    }
    bool ok = true;
    for (const QString &p : a.verifyPut)
        ok = runVerify(session, sroscli::TransferDirection::Put, p, fileSystem) && ok;
    for (const QString &p : a.verifyGet)
        ok = runVerify(session, sroscli::TransferDirection::Get, p, fileSystem) && ok;
    return ok;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SrosCli");
    QCoreApplication::setApplicationName("sroscli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Drive the SR OS CLI over SSH");
    parser.addHelpOption();
    const QCommandLineOption siteOpt("site", "Saved site to connect to.", "name");
    const QCommandLineOption hostOpt("host", "Device host name or address.", "host");
    const QCommandLineOption portOpt("port", "SSH port.", "port", "22");
    const QCommandLineOption userOpt("user", "SSH user name.", "user");
    const QCommandLineOption passOpt("password", "SSH password.", "password");
    const QCommandLineOption keyOpt("key", "Private key file.", "file");
    const QCommandLineOption configOpt("config-file",
                                       "Configuration commands, one per line.", "file");
    const QCommandLineOption commitOpt("commit", "Commit the candidate configuration.");
    const QCommandLineOption saveOpt("save", "Save the running configuration.");
    const QCommandLineOption commandOpt("command", "Command to run (repeatable).", "cmd");
    const QCommandLineOption putOpt("verify-put",
                                    "Verify an uploaded file by size.", "local=remote");
    const QCommandLineOption getOpt("verify-get",
                                    "Verify a downloaded file by size.", "remote=local");
    const QCommandLineOption fsOpt("file-system", "Remote file system (default cf3:).", "fs");
    const QCommandLineOption delayOpt("delay-factor", "Global delay factor.", "factor");
    const QCommandLineOption noVerifyOpt("no-cmd-verify", "Do not wait for command echo.");
    const QCommandLineOption verboseOpt("verbose", "Debug logging.");
    parser.addOptions({siteOpt, hostOpt, portOpt, userOpt, passOpt, keyOpt, configOpt,
                       commitOpt, saveOpt, commandOpt, putOpt, getOpt, fsOpt, delayOpt,
                       noVerifyOpt, verboseOpt});
    parser.process(app);

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules(QStringLiteral("sroscli.*.debug=true"));

    const AdvancedSettings adv = loadAdvancedSettings();
    sroscli::SessionOptions opt;
    if (parser.isSet(siteOpt)) {
        SiteEntry site;
        if (!findSavedSite(parser.value(siteOpt), site)) {
            std::cerr << "Unknown site: " << parser.value(siteOpt).toStdString() << "\n";
            return 1;
        }
        opt = site.opt;
    }
    if (parser.isSet(hostOpt))
        opt.host = parser.value(hostOpt).toStdString();
    if (parser.isSet(portOpt) || !parser.isSet(siteOpt)) {
        bool okPort = false;
        const uint port = parser.value(portOpt).toUInt(&okPort);
        if (!okPort || port == 0 || port > 65535) {
            std::cerr << "Invalid port: " << parser.value(portOpt).toStdString() << "\n";
            return 1;
        }
        opt.port = static_cast<std::uint16_t>(port);
    }
    if (parser.isSet(userOpt))
        opt.username = parser.value(userOpt).toStdString();
    if (parser.isSet(passOpt))
        opt.password = parser.value(passOpt).toStdString();
    if (parser.isSet(keyOpt))
        opt.private_key_path = parser.value(keyOpt).toStdString();
    if (opt.host.empty() || opt.username.empty()) {
        std::cerr << "A site or --host and --user are required\n";
        return 1;
    }

    opt.tuning = adv.tuning;
    if (parser.isSet(delayOpt)) {
        bool okFactor = false;
        const double f = parser.value(delayOpt).toDouble(&okFactor);
        if (!okFactor || f < 0.0) {
            std::cerr << "Invalid delay factor: " << parser.value(delayOpt).toStdString() << "\n";
            return 1;
        }
        opt.tuning.global_delay_factor = f;
    }
    if (parser.isSet(noVerifyOpt))
        opt.tuning.cmd_verify = false;
    opt.hostkey_confirm_cb = [](const std::string &host, std::uint16_t port,
                                const std::string &algorithm, const std::string &fingerprint) {
        std::cerr << "Unknown host " << host << ":" << port << "\n"
                  << algorithm << " " << fingerprint << "\n";
        return askYesNo("Trust this host key?");
    };

    Action action;
    if (parser.isSet(configOpt)) {
        QString err;
        if (!readConfigFile(parser.value(configOpt), action.configLines, err)) {
            std::cerr << err.toStdString() << "\n";
            return 1;
        }
    }
    action.commit = parser.isSet(commitOpt);
    action.save = parser.isSet(saveOpt);
    action.commands = parser.values(commandOpt);
    action.verifyPut = parser.values(putOpt);
    action.verifyGet = parser.values(getOpt);
    const QString fileSystem = parser.isSet(fsOpt) ? parser.value(fsOpt) : adv.fileSystem;

    sroscli::Libssh2Channel channel;
    std::string connErr;
    if (!channel.connect(opt, connErr)) {
        qCritical(scApp) << "connect failed:" << connErr.c_str();
        std::cerr << "Connection failed: " << connErr << "\n";
        return 1;
    }

    sroscli::CliOptions cliOpt;
    cliOpt.exit_config_max_attempts = adv.exitConfigMaxAttempts;
    cliOpt.terminal_width = opt.term_width;
    sroscli::CliSession session(channel, cliOpt);

    bool ok = false;
    sroscli::CliError err;
    if (!session.prepare(err)) {
        reportError("prepare", err);
    } else {
        qInfo(scApp) << "Connected to" << opt.host.c_str() << "as"
                     << session.personality()->name() << "CLI";
        ok = runActions(session, action, fileSystem);
    }
    session.cleanup();
    return ok ? 0 : 1;
}
