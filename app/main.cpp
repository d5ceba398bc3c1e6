// Command line front end: runs one command against a saved site or a URL.
#include "AppLogging.hpp"
#include "SiteStore.hpp"
#include "TransferWorker.hpp"
#include "tscp/HostBridge.hpp"
#include "tscp/RuntimeLogging.hpp"
#include "tscp/SyncPlanner.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace {

enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitUsage = 2 };

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) { g_interrupted.store(true); }

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& errOut() {
    static QTextStream s(stderr);
    return s;
}

QString q(const std::string& s) { return QString::fromStdString(s); }

bool askYesNo(const QString& question) {
    if (!::isatty(STDIN_FILENO)) return false;
    errOut() << question << " [y/N] " << Qt::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return false;
    return !line.empty() && (line[0] == 'y' || line[0] == 'Y');
}

int usage(const QCommandLineParser& parser, const QString& msg) {
    if (!msg.isEmpty()) errOut() << "tscp: " << msg << "\n";
    errOut() << parser.helpText();
    return ExitUsage;
}

int report(const tscp::BridgeError& e) {
    qCWarning(tscpCli) << "command failed" << q(toString(e.kind));
    errOut() << "tscp: " << q(e.describe()) << "\n";
    return ExitFailure;
}

QString modeString(const tscp::RemoteEntry& e) {
    QString s(10, QLatin1Char('-'));
    if (e.is_symlink) s[0] = QLatin1Char('l');
    else if (e.is_directory) s[0] = QLatin1Char('d');
    if (!e.permissions) {
        for (int i = 1; i < 10; ++i) s[i] = QLatin1Char('?');
        return s;
    }
    static const char flags[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (*e.permissions & (0400u >> i)) s[i + 1] = QLatin1Char(flags[i]);
    }
    return s;
}

bool connectBridge(tscp::HostBridge& bridge, const tscp::HostConfig& cfg, tscp::BridgeError& err) {
    qCInfo(tscpSession) << "connecting" << tscp::protocolName(cfg.protocol)
                        << "host=" << q(tscp::loggable(cfg.host)) << "port=" << cfg.effectivePort()
                        << "user=" << q(tscp::loggable(cfg.username));
    if (!bridge.connect(cfg, err)) {
        qCWarning(tscpSession) << "connect failed" << q(toString(err.kind)) << "timed_out=" << err.timed_out;
        return false;
    }
    qCInfo(tscpSession) << "connected";
    return true;
}

// "put a.txt /dir" writes /dir/a.txt when /dir is a directory.
std::string destinationFor(tscp::HostBridge& dst, const std::string& dstPath, const std::string& srcPath) {
    bool isDir = false;
    tscp::BridgeError err;
    if (dst.isDirectory(dstPath, isDir, err) && isDir)
        return tscp::joinPath(dstPath, tscp::baseName(tscp::resolvePath("/", srcPath)));
    return dstPath;
}

int runTransfer(QCoreApplication& app, std::shared_ptr<tscp::HostBridge> src, const std::string& srcPath,
                std::shared_ptr<tscp::HostBridge> dst, const std::string& dstPath,
                const tscp::TransferOptions& options) {
    TransferWorker worker;
    const bool showProgress = ::isatty(STDERR_FILENO);
    QObject::connect(&worker, &TransferWorker::progress, &app,
                     [showProgress](quint64, const tscp::TransferProgress& p) {
                         if (!showProgress || p.batch_total == 0) return;
                         errOut() << "\r" << (p.batch_done * 100 / p.batch_total) << "% "
                                  << q(tscp::baseName(p.path)) << "\x1b[K" << Qt::flush;
                     });
    QObject::connect(&worker, &TransferWorker::outcome, &app,
                     [showProgress](quint64, const tscp::TransferOutcome& o) {
                         if (showProgress) errOut() << "\r\x1b[K" << Qt::flush;
                         const QString path = q(o.task.destination_path);
                         switch (o.status) {
                         case tscp::TransferOutcome::Status::Success:
                             out() << "ok    " << path << " (" << o.bytes_written << " bytes)\n";
                             break;
                         case tscp::TransferOutcome::Status::Skipped:
                             out() << "skip  " << path << ": " << q(o.reason) << "\n";
                             break;
                         case tscp::TransferOutcome::Status::Failed:
                             out() << "FAIL  " << q(o.error.describe()) << "\n";
                             break;
                         }
                         if (o.partial_destination) out() << "      partial file left at " << path << "\n";
                         for (const auto& w : o.warnings) out() << "      warning: " << q(w) << "\n";
                         out().flush();
                     });
    QObject::connect(&worker, &TransferWorker::finished, &app,
                     [&app](quint64, const tscp::TransferReport& r) {
                         out() << q(r.summary()) << "\n";
                         out().flush();
                         app.exit(r.ok() ? ExitOk : ExitFailure);
                     });

    TransferJob job;
    job.source = std::move(src);
    job.sourcePath = srcPath;
    job.destination = std::move(dst);
    job.destinationPath = dstPath;
    job.options = options;
    worker.enqueue(std::move(job));
    return app.exec();
}

} // namespace

int main(int argc, char* argv[]) {
    // TLS and SSH writes to a closed peer must fail with EPIPE instead of
    // killing the process.
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, onInterrupt);

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("tscp");
    QCoreApplication::setOrganizationName("tscp");

    QCommandLineParser parser;
    parser.setApplicationDescription("File transfer over SCP, SFTP, FTP and FTPS.");
    parser.addHelpOption();
    QCommandLineOption siteOpt("site", "Saved site to connect to.", "name");
    QCommandLineOption urlOpt("url", "scheme://[user@]host[:port][/path] with scp, sftp, ftp or ftps.", "url");
    QCommandLineOption passwordEnvOpt("password-env", "Environment variable holding the password.", "var");
    QCommandLineOption passphraseEnvOpt("passphrase-env", "Environment variable holding the key passphrase.",
                                        "var");
    QCommandLineOption keyOpt("key", "Private key file.", "path");
    QCommandLineOption knownHostsOpt("known-hosts", "Host key policy: strict, accept-new or off.", "policy");
    QCommandLineOption policyOpt("policy", "Overwrite policy: newer, always, never or prompt.", "policy", "newer");
    QCommandLineOption noRecursiveOpt("no-recursive", "Do not descend into sub-directories.");
    QCommandLineOption saveSiteOpt("save-site", "Store the --url connection under this name.", "name");
    parser.addOptions({siteOpt, urlOpt, passwordEnvOpt, passphraseEnvOpt, keyOpt, knownHostsOpt, policyOpt,
                       noRecursiveOpt, saveSiteOpt});
    parser.addPositionalArgument("command", "ls, get, put, sync, rm, mkdir, mv, sites or forget.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    if (!parser.parse(app.arguments())) return usage(parser, parser.errorText());
    if (parser.isSet("help")) {
        out() << parser.helpText();
        return ExitOk;
    }
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) return usage(parser, "missing command");
    const QString command = args.first();
    const QStringList rest = args.mid(1);
    auto arg = [&rest](int i, const char* fallback) {
        return i < rest.size() ? rest[i].toStdString() : std::string(fallback);
    };

    SiteStore store;
    store.load();
    if (command == "sites") {
        for (const auto& s : store.sites()) {
            out() << s.name << "  " << tscp::protocolName(s.opt.protocol) << "://"
                  << q(s.opt.username) << "@" << q(s.opt.host) << ":" << s.opt.effectivePort() << "\n";
        }
        return ExitOk;
    }
    if (command == "forget") {
        if (rest.size() != 1) return usage(parser, "forget takes a site name");
        if (!store.remove(rest[0])) {
            errOut() << "tscp: no saved site named " << rest[0] << "\n";
            return ExitFailure;
        }
        store.save();
        return ExitOk;
    }

    // Remote session options
    tscp::HostConfig cfg;
    if (parser.isSet(siteOpt) == parser.isSet(urlOpt)) return usage(parser, "exactly one of --site or --url");
    if (parser.isSet(siteOpt)) {
        const SiteEntry* site = store.find(parser.value(siteOpt));
        if (!site) return usage(parser, "no saved site named " + parser.value(siteOpt));
        cfg = site->opt;
    } else {
        std::string msg;
        if (!tscp::parseHostUrl(parser.value(urlOpt).toStdString(), cfg, msg)) return usage(parser, q(msg));
    }
    if (parser.isSet(keyOpt)) cfg.private_key_path = parser.value(keyOpt).toStdString();
    if (parser.isSet(knownHostsOpt)) {
        const QString p = parser.value(knownHostsOpt);
        if (p == "strict") cfg.known_hosts_policy = tscp::KnownHostsPolicy::Strict;
        else if (p == "accept-new") cfg.known_hosts_policy = tscp::KnownHostsPolicy::AcceptNew;
        else if (p == "off") cfg.known_hosts_policy = tscp::KnownHostsPolicy::Off;
        else return usage(parser, "unknown --known-hosts policy " + p);
    }
    if (parser.isSet(saveSiteOpt)) {
        SiteEntry e;
        e.name = parser.value(saveSiteOpt);
        e.opt = cfg;
        store.upsert(e);
        store.save();
        qCInfo(tscpCli) << "site saved" << e.name;
    }
    // secrets are applied after saving so they never reach the settings file
    if (parser.isSet(passwordEnvOpt)) {
        const char* v = std::getenv(parser.value(passwordEnvOpt).toLocal8Bit().constData());
        if (!v) return usage(parser, "environment variable " + parser.value(passwordEnvOpt) + " is not set");
        cfg.password = std::string(v);
    }
    if (parser.isSet(passphraseEnvOpt)) {
        const char* v = std::getenv(parser.value(passphraseEnvOpt).toLocal8Bit().constData());
        if (!v) return usage(parser, "environment variable " + parser.value(passphraseEnvOpt) + " is not set");
        cfg.private_key_passphrase = std::string(v);
    }
    cfg.hostkey_confirm_cb = [](const std::string& host, std::uint16_t port, const std::string& alg,
                                const std::string& fp) {
        return askYesNo(QString("Unknown host key for %1:%2 (%3 %4). Trust it?")
                            .arg(q(host))
                            .arg((int)port)
                            .arg(q(alg), q(fp)));
    };
    const std::optional<std::string> password = cfg.password;
    cfg.keyboard_interactive_cb = [password](const std::string&, const std::string&,
                                             const std::vector<std::string>& prompts,
                                             std::vector<std::string>& responses) {
        if (!password) return false;
        responses.assign(prompts.size(), *password);
        return true;
    };

    tscp::TransferOptions options;
    options.recursive = !parser.isSet(noRecursiveOpt);
    if (!tscp::parseOverwritePolicy(parser.value(policyOpt).toStdString(), options.overwrite_policy))
        return usage(parser, "unknown --policy " + parser.value(policyOpt));
    options.should_cancel = [] { return g_interrupted.load(); };
    options.resolve_conflict = [](const tscp::SyncDecision& d) {
        const bool yes = askYesNo(QString("%1 is newer or differs at the destination. Overwrite?")
                                      .arg(q(d.task.destination_path)));
        return yes ? tscp::SyncAction::Overwrite : tscp::SyncAction::Skip;
    };

    std::shared_ptr<tscp::HostBridge> remote = tscp::makeBridge(cfg.protocol);
    std::shared_ptr<tscp::HostBridge> local = tscp::makeBridge(tscp::Protocol::Local);
    tscp::BridgeError err;
    tscp::HostConfig localCfg;
    localCfg.protocol = tscp::Protocol::Local;
    if (!local->connect(localCfg, err)) return report(err);
    if (!connectBridge(*remote, cfg, err)) return report(err);

    int code = ExitOk;
    if (command == "ls") {
        tscp::ListResult listing;
        if (!remote->list(arg(0, "."), listing, err)) {
            code = report(err);
        } else {
            for (const auto& e : listing.entries) {
                out() << modeString(e) << " " << QString::number(e.size.value_or(0)).rightJustified(12) << " "
                      << (e.mtime ? QString::number(*e.mtime) : QString("?")).rightJustified(11) << " "
                      << q(e.name);
                if (e.symlink_target) out() << " -> " << q(*e.symlink_target);
                out() << "\n";
            }
            if (listing.skipped_lines)
                errOut() << "tscp: " << listing.skipped_lines << " listing lines could not be parsed\n";
        }
    } else if (command == "get") {
        if (rest.isEmpty() || rest.size() > 2) {
            code = usage(parser, "get REMOTE [LOCAL]");
        } else {
            const std::string src = arg(0, "");
            code = runTransfer(app, remote, src, local, destinationFor(*local, arg(1, "."), src), options);
        }
    } else if (command == "put") {
        if (rest.isEmpty() || rest.size() > 2) {
            code = usage(parser, "put LOCAL [REMOTE]");
        } else {
            const std::string src = arg(0, "");
            code = runTransfer(app, local, src, remote, destinationFor(*remote, arg(1, "."), src), options);
        }
    } else if (command == "sync") {
        if (rest.size() != 2) {
            code = usage(parser, "sync LOCAL REMOTE");
        } else {
            tscp::TreeSnapshot source, destination;
            if (!tscp::snapshotTree(*local, arg(0, ""), options.recursive, source, err)) {
                code = report(err);
            } else {
                // a missing remote root is an empty destination
                if (!tscp::snapshotTree(*remote, arg(1, ""), options.recursive, destination, err)) {
                    destination = tscp::TreeSnapshot{};
                    destination.root = arg(1, "");
                }
                tscp::SyncOptions so;
                so.policy = options.overwrite_policy;
                so.mtime_tolerance_secs = options.mtime_tolerance_secs;
                const tscp::SyncPlan plan = tscp::planSync(source, destination, so);
                out() << "plan: " << plan.count(tscp::SyncAction::Copy) << " copy, "
                      << plan.count(tscp::SyncAction::Overwrite) << " overwrite, "
                      << plan.count(tscp::SyncAction::Skip) << " skip, "
                      << plan.count(tscp::SyncAction::Conflict) << " conflict\n";
                if (!plan.complete())
                    errOut() << "tscp: listing incomplete (" << plan.source_unparsed << " local, "
                             << plan.destination_unparsed << " remote lines unparsed)\n";
                if (err && err.kind != tscp::ErrorKind::NotFound) {
                    code = report(err);
                } else {
                    // the engine carries out the plan printed above
                    for (const auto& d : plan.decisions) {
                        if (d.task.kind != tscp::TaskKind::Directory)
                            options.planned_actions[d.task.destination_path] = d.action;
                    }
                    code = runTransfer(app, local, arg(0, ""), remote, arg(1, ""), options);
                }
            }
        }
    } else if (command == "rm") {
        if (rest.size() != 1) code = usage(parser, "rm PATH");
        else if (!remote->remove(arg(0, ""), options.recursive, err)) code = report(err);
    } else if (command == "mkdir") {
        if (rest.size() != 1) code = usage(parser, "mkdir PATH");
        else if (!remote->createDirectory(arg(0, ""), err)) code = report(err);
    } else if (command == "mv") {
        if (rest.size() != 2) code = usage(parser, "mv FROM TO");
        else if (!remote->rename(arg(0, ""), arg(1, ""), err)) code = report(err);
    } else {
        code = usage(parser, "unknown command " + command);
    }

    remote->disconnect();
    qCInfo(tscpSession) << "disconnected";
    return code;
}
