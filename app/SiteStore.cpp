// Site list in the "sites" settings array.
#include "SiteStore.hpp"
#include <QSettings>
#include <memory>

static std::unique_ptr<QSettings> openSettings(const QString& iniPath) {
    if (iniPath.isEmpty()) return std::make_unique<QSettings>("tscp", "tscp");
    return std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
}

static tscp::Protocol protocolFromName(const QString& name) {
    for (auto p : {tscp::Protocol::Scp, tscp::Protocol::Sftp, tscp::Protocol::Ftp, tscp::Protocol::Ftps}) {
        if (name == QLatin1String(tscp::protocolName(p))) return p;
    }
    return tscp::Protocol::Sftp;
}

SiteStore::SiteStore(const QString& iniPath) : iniPath_(iniPath) {}

void SiteStore::load() {
    sites_.clear();
    auto s = openSettings(iniPath_);
    int n = s->beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s->setArrayIndex(i);
        SiteEntry e;
        e.name = s->value("name").toString();
        e.opt.protocol = protocolFromName(s->value("protocol", "sftp").toString());
        e.opt.host = s->value("host").toString().toStdString();
        e.opt.port = (std::uint16_t)s->value("port", 0).toUInt();
        e.opt.username = s->value("user").toString().toStdString();
        const QString kp = s->value("keyPath").toString();
        if (!kp.isEmpty()) e.opt.private_key_path = kp.toStdString();
        const QString kh = s->value("knownHosts").toString();
        if (!kh.isEmpty()) e.opt.known_hosts_path = kh.toStdString();
        e.opt.known_hosts_policy =
            (tscp::KnownHostsPolicy)s->value("khPolicy", (int)tscp::KnownHostsPolicy::Strict).toInt();
        const QString root = s->value("remoteRoot").toString();
        if (!root.isEmpty()) e.opt.remote_root = root.toStdString();
        sites_.push_back(e);
    }
    s->endArray();
}

void SiteStore::save() const {
    auto s = openSettings(iniPath_);
    s->remove("sites");
    s->beginWriteArray("sites");
    for (int i = 0; i < sites_.size(); ++i) {
        s->setArrayIndex(i);
        const auto& e = sites_[i];
        s->setValue("name", e.name);
        s->setValue("protocol", QString::fromLatin1(tscp::protocolName(e.opt.protocol)));
        s->setValue("host", QString::fromStdString(e.opt.host));
        s->setValue("port", (int)e.opt.port);
        s->setValue("user", QString::fromStdString(e.opt.username));
        s->setValue("keyPath", e.opt.private_key_path ? QString::fromStdString(*e.opt.private_key_path) : QString());
        s->setValue("knownHosts",
                    e.opt.known_hosts_path ? QString::fromStdString(*e.opt.known_hosts_path) : QString());
        s->setValue("khPolicy", (int)e.opt.known_hosts_policy);
        s->setValue("remoteRoot", e.opt.remote_root ? QString::fromStdString(*e.opt.remote_root) : QString());
    }
    s->endArray();
    s->sync();
}

const SiteEntry* SiteStore::find(const QString& name) const {
    for (const auto& e : sites_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

void SiteStore::upsert(const SiteEntry& entry) {
    for (auto& e : sites_) {
        if (e.name == entry.name) {
            e = entry;
            return;
        }
    }
    sites_.push_back(entry);
}

bool SiteStore::remove(const QString& name) {
    for (int i = 0; i < sites_.size(); ++i) {
        if (sites_[i].name == name) {
            sites_.remove(i);
            return true;
        }
    }
    return false;
}
