// Saved sites persisted with QSettings. Passwords are never stored.
#pragma once
#include "tscp/HostTypes.hpp"
#include <QString>
#include <QVector>

struct SiteEntry {
    QString name;
    tscp::HostConfig opt;
};

class SiteStore {
public:
    // Empty iniPath: the user's QSettings("tscp", "tscp").
    explicit SiteStore(const QString& iniPath = QString());

    void load();
    void save() const;

    const QVector<SiteEntry>& sites() const { return sites_; }
    const SiteEntry* find(const QString& name) const;
    // Replaces the site with the same name or appends it.
    void upsert(const SiteEntry& entry);
    bool remove(const QString& name);

private:
    QString iniPath_;
    QVector<SiteEntry> sites_;
};
