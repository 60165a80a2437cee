// Resolves connection settings for the host: environment (plus an optional
// dotenv file) first, then QSettings, then platform defaults.
#pragma once
#include <QString>
#include "pibridge/BridgeCommands.hpp"
#include "pibridge/ConnectionConfig.hpp"

class BridgeSettings {
public:
    // envFile: dotenv file to read; empty uses ".env" in the working
    // directory if present.
    explicit BridgeSettings(QString envFile = {});

    // Resolves a fresh config on every call.
    bool load(pibridge::ConnectionConfig& out, pibridge::Error& err) const;

    pibridge::BridgeCommands::ConfigProvider provider() const;

    static QString defaultDownloadDir();

private:
    QString envFile_;
};
