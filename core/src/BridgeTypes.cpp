#include "pibridge/BridgeError.hpp"
#include "pibridge/BridgeTypes.hpp"

namespace pibridge {

std::string FileKind::label() const {
    switch (tag) {
        case Tag::Directory: return "Directory";
        case Tag::Extension: return extension;
        case Tag::Unknown: break;
    }
    return "Unknown";
}

const char* topicName(ProgressTopic topic) {
    switch (topic) {
        case ProgressTopic::TotalSize: return "total-size";
        case ProgressTopic::DownloadProgress: return "download-progress";
        case ProgressTopic::UploadProgress: return "upload-progress";
        case ProgressTopic::ZipProgress: return "zip-progress";
    }
    return "unknown";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Config: return "config";
        case ErrorKind::Connection: return "connection";
        case ErrorKind::RemoteProtocol: return "remote";
        case ErrorKind::LocalIO: return "local-io";
        case ErrorKind::Archive: return "archive";
        case ErrorKind::Path: return "path";
    }
    return "unknown";
}

std::string Error::describe() const {
    return std::string("[") + errorKindName(kind) + "] " + message;
}

} // namespace pibridge
