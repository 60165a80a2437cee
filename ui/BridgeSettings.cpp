#include "BridgeSettings.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>
#include <map>
#include <utility>

Q_LOGGING_CATEGORY(pbSettings, "pibridge.settings")

namespace {

// Environment key -> QSettings key
const std::pair<const char*, const char*> kSettingsKeys[] = {
    {pibridge::kEnvHost, "Connection/host"},
    {pibridge::kEnvUsername, "Connection/username"},
    {pibridge::kEnvPassword, "Connection/password"},
    {pibridge::kEnvPort, "Connection/port"},
    {pibridge::kEnvKnownHostsPolicy, "Security/knownHostsPolicy"},
    {pibridge::kEnvKnownHosts, "Security/knownHostsPath"},
    {pibridge::kEnvBaseDir, "Workspace/baseDir"},
    {pibridge::kEnvDownloadsDir, "UI/defaultDownloadDir"},
};

} // namespace

BridgeSettings::BridgeSettings(QString envFile) : envFile_(std::move(envFile)) {}

QString BridgeSettings::defaultDownloadDir() {
    QString p = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (p.isEmpty()) p = QDir::homePath() + "/Downloads";
    return p;
}

bool BridgeSettings::load(pibridge::ConnectionConfig& out, pibridge::Error& err) const {
    std::map<std::string, std::string> fallback;

    const QString envPath = envFile_.isEmpty() ? QDir::current().filePath(".env") : envFile_;
    if (!envFile_.isEmpty() && !QFileInfo::exists(envPath))
        return err.set(pibridge::ErrorKind::Config, "Failed to load " + envPath.toStdString() + ": not found");
    if (!pibridge::loadDotEnvFile(envPath.toStdString(), fallback, err)) return false;

    // QSettings only fills what neither the environment nor the dotenv
    // file provide.
    QSettings s("pibridge", "pibridge");
    for (const auto& kv : kSettingsKeys) {
        if (fallback.count(kv.first)) continue;
        const QString v = s.value(kv.second).toString().trimmed();
        if (!v.isEmpty()) fallback[kv.first] = v.toStdString();
    }

    const auto env = pibridge::layeredLookup(pibridge::processEnvironment(), std::move(fallback));
    if (!pibridge::loadConnectionConfig(env, out, err)) return false;

    if (out.downloads_dir.empty()) out.downloads_dir = QDir::cleanPath(defaultDownloadDir()).toStdString();
    qCDebug(pbSettings) << "downloads dir" << QString::fromStdString(out.downloads_dir);
    return true;
}

pibridge::BridgeCommands::ConfigProvider BridgeSettings::provider() const {
    BridgeSettings copy = *this;
    return [copy](pibridge::ConnectionConfig& cfg, pibridge::Error& err) { return copy.load(cfg, err); };
}
