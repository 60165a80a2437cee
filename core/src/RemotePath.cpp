#include "pibridge/RemotePath.hpp"
#include <cctype>

namespace pibridge {

std::string joinRemote(const std::string& base, const std::string& name) {
    if (base.empty()) return "/" + name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

bool validateSegment(const std::string& segment, Error& err) {
    if (segment.empty())
        return err.set(ErrorKind::Path, "Invalid name: empty path component");
    if (segment == "." || segment == "..")
        return err.set(ErrorKind::Path, "Invalid name '" + segment + "': relative components are not allowed");
    if (segment.find('/') != std::string::npos)
        return err.set(ErrorKind::Path, "Invalid name '" + segment + "': contains '/'");
    if (segment.find('\0') != std::string::npos)
        return err.set(ErrorKind::Path, "Invalid name: contains a NUL byte");
    return true;
}

bool joinSegments(const std::string& root,
                  const std::vector<std::string>& segments,
                  std::string& out,
                  Error& err) {
    std::string path = root;
    for (const auto& seg : segments) {
        if (!validateSegment(seg, err)) return false;
        path = joinRemote(path, seg);
    }
    out = std::move(path);
    return true;
}

bool splitPath(const std::string& path, std::vector<std::string>& out, Error& err) {
    out.clear();
    std::size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;
    std::size_t end = path.size();
    while (end > start && path[end - 1] == '/') --end;
    while (start < end) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos || slash > end) slash = end;
        std::string seg = path.substr(start, slash - start);
        if (!validateSegment(seg, err)) return false;
        out.push_back(std::move(seg));
        start = slash + 1;
    }
    return true;
}

bool baseName(const std::string& path, std::string& out, Error& err) {
    std::size_t end = path.size();
    while (end > 0 && path[end - 1] == '/') --end;
    std::size_t start = end == 0 ? std::string::npos : path.find_last_of('/', end - 1);
    start = start == std::string::npos ? 0 : start + 1;
    std::string name = path.substr(start, end - start);
    if (name.empty() || name == "." || name == "..")
        return err.set(ErrorKind::Path, "Cannot determine file name of '" + path + "'");
    out = std::move(name);
    return true;
}

std::string extensionOf(const std::string& name) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) return {};
    std::string ext = name.substr(dot + 1);
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

} // namespace pibridge
