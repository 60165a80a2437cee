// Command-line host: parses one command, runs it against a fresh session
// and prints progress events and the result as JSON lines on stdout.
#include "BridgeSettings.hpp"
#include "QtProgressSink.hpp"
#include "pibridge/BridgeCommands.hpp"
#include "pibridge/Libssh2Session.hpp"
#include "pibridge/LogRedaction.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>
#include <QTextStream>
#include <cstdio>
#include <string>
#include <vector>

Q_LOGGING_CATEGORY(pbCmd, "pibridge.command")
Q_LOGGING_CATEGORY(pbProgress, "pibridge.progress")

namespace {

void printLine(const QJsonObject& obj) {
    const QByteArray line = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

std::string toStd(const QString& s) { return s.toStdString(); }

std::vector<std::string> toStdList(const QStringList& list) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(list.size()));
    for (const QString& s : list) out.push_back(s.toStdString());
    return out;
}

// "a/b/c" -> {"a","b","c"}. Empty input is the workspace root.
std::vector<std::string> splitCurrentPath(const QString& path) {
    return toStdList(path.split('/', Qt::SkipEmptyParts));
}

QJsonObject descriptorJson(const pibridge::FileDescriptor& d) {
    QJsonObject o;
    o.insert("name", QString::fromStdString(d.name));
    o.insert("type", QString::fromStdString(d.kind.label()));
    o.insert("is_dir", d.kind.isDirectory());
    o.insert("size", static_cast<qint64>(d.size));
    o.insert("last_modified", QString::fromStdString(d.last_modified));
    return o;
}

int finish(const QString& command, bool ok, const pibridge::Error& err, QJsonObject result = {}) {
    if (ok) {
        qCInfo(pbCmd) << command << "finished";
        result.insert("ok", true);
        printLine(result);
        return 0;
    }
    qCWarning(pbCmd) << command << "failed:" << QString::fromStdString(err.describe());
    QJsonObject e;
    e.insert("kind", QString::fromLatin1(pibridge::errorKindName(err.kind)));
    e.insert("message", QString::fromStdString(err.message));
    QJsonObject out;
    out.insert("ok", false);
    out.insert("error", e);
    printLine(out);
    return 1;
}

bool needArgs(const QStringList& args, int n, const QString& usage, pibridge::Error& err) {
    if (args.size() >= n) return true;
    return err.set(pibridge::ErrorKind::Path, "usage: pibridge " + toStd(usage));
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("pibridge");
    QCoreApplication::setApplicationName("pibridge");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Remote file bridge for a Raspberry Pi workspace over SSH/SFTP.\n\n"
        "Commands:\n"
        "  connect                      list the current directory\n"
        "  download <name>...           download files (several or a directory: ZIP)\n"
        "  upload <local-file>...       upload local files\n"
        "  mkdir <name>                 create a folder\n"
        "  rename <old> <new>           rename an entry\n"
        "  delete <name>...             delete entries (directories recursively)\n"
        "  read <name>                  print a file's content\n"
        "  save <name> [<local-file>]   store content (from stdin when no file)\n"
        "  storage-used                 bytes stored in the workspace\n"
        "  file-sizes <local-file>...   sizes of local files");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption userOpt({"u", "user"}, "Workspace user name.", "name");
    QCommandLineOption pathOpt({"p", "path"}, "Current path below the workspace root (a/b/c).", "path");
    QCommandLineOption envOpt("env-file", "Dotenv file with PIBRIDGE_* settings.", "file");
    QCommandLineOption progressOpt("progress", "Print progress events.");
    parser.addOption(userOpt);
    parser.addOption(pathOpt);
    parser.addOption(envOpt);
    parser.addOption(progressOpt);
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) parser.showHelp(2);
    const QString command = positional.takeFirst();
    const QStringList args = positional;

    // Workspaces are keyed by the lowercased user name.
    const std::string user = toStd(parser.value(userOpt).trimmed().toLower());
    const QString path = parser.value(pathOpt);
    const std::vector<std::string> current = splitCurrentPath(path);

    QtProgressSink progress;
    QObject::connect(&progress, &QtProgressSink::progress, [&](const QString& topic, quint64 value) {
        qCDebug(pbProgress) << topic << value;
        if (!parser.isSet(progressOpt)) return;
        QJsonObject ev;
        ev.insert("event", topic);
        ev.insert("payload", static_cast<qint64>(value));
        printLine(ev);
    });

    BridgeSettings settings(parser.value(envOpt));
    pibridge::Libssh2SessionFactory factory;
    pibridge::BridgeCommands bridge(factory, settings.provider(), progress);

    qCInfo(pbCmd) << command << "started"
                  << "user=" << QString::fromStdString(pibridge::loggable(user));

    pibridge::Error err;

    if (command == "file-sizes") {
        std::vector<std::uint64_t> sizes;
        const bool ok = pibridge::BridgeCommands::fileSizes(toStdList(args), sizes, err);
        QJsonArray arr;
        for (std::uint64_t s : sizes) arr.append(static_cast<qint64>(s));
        QJsonObject res;
        res.insert("sizes", arr);
        return finish(command, ok, err, res);
    }
    if (command == "connect") {
        std::vector<pibridge::FileDescriptor> entries;
        const bool ok = bridge.connectToPi(user, toStd(path), entries, err);
        QJsonArray arr;
        for (const auto& d : entries) arr.append(descriptorJson(d));
        QJsonObject res;
        res.insert("entries", arr);
        return finish(command, ok, err, res);
    }
    if (command == "download") {
        std::string local;
        bool ok = needArgs(args, 1, "download <name>...", err) &&
                  bridge.downloadFiles(user, current, toStdList(args), local, err);
        QJsonObject res;
        res.insert("local_path", QString::fromStdString(local));
        return finish(command, ok, err, res);
    }
    if (command == "upload") {
        bool ok = needArgs(args, 1, "upload <local-file>...", err) &&
                  bridge.uploadFiles(user, current, toStdList(args), err);
        return finish(command, ok, err);
    }
    if (command == "mkdir") {
        bool ok = needArgs(args, 1, "mkdir <name>", err) &&
                  bridge.createFolder(user, current, toStd(args.at(0)), err);
        return finish(command, ok, err);
    }
    if (command == "rename") {
        bool ok = needArgs(args, 2, "rename <old> <new>", err) &&
                  bridge.renameFile(user, current, toStd(args.at(0)), toStd(args.at(1)), err);
        return finish(command, ok, err);
    }
    if (command == "delete") {
        bool ok = needArgs(args, 1, "delete <name>...", err) &&
                  bridge.deleteFiles(user, current, toStdList(args), err);
        return finish(command, ok, err);
    }
    if (command == "read") {
        std::string content;
        bool ok = needArgs(args, 1, "read <name>", err) &&
                  bridge.readFile(user, current, toStd(args.at(0)), content, err);
        QJsonObject res;
        res.insert("content", QString::fromStdString(content));
        return finish(command, ok, err, res);
    }
    if (command == "save") {
        if (!needArgs(args, 1, "save <name> [<local-file>]", err)) return finish(command, false, err);
        QFile in;
        bool opened = false;
        if (args.size() >= 2) {
            in.setFileName(args.at(1));
            opened = in.open(QIODevice::ReadOnly);
        } else {
            opened = in.open(stdin, QIODevice::ReadOnly);
        }
        if (!opened) {
            err.set(pibridge::ErrorKind::LocalIO, "Failed to open content source: " + toStd(in.errorString()));
            return finish(command, false, err);
        }
        const QByteArray data = in.readAll();
        const bool ok = bridge.saveFile(user, current, toStd(args.at(0)),
                                        std::string(data.constData(), static_cast<size_t>(data.size())), err);
        return finish(command, ok, err);
    }
    if (command == "storage-used") {
        std::uint64_t total = 0;
        const bool ok = bridge.storageUsed(user, total, err);
        QJsonObject res;
        res.insert("bytes", static_cast<qint64>(total));
        return finish(command, ok, err, res);
    }

    QTextStream(stderr) << "Unknown command: " << command << "\n";
    parser.showHelp(2);
}
