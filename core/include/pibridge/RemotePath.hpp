// Remote path composition. User supplied names are single path components:
// empty names, "." , "..", and names with '/' or NUL are rejected with a
// Path error before anything touches the remote host.
#pragma once
#include "BridgeError.hpp"
#include <string>
#include <vector>

namespace pibridge {

// Joins with exactly one '/'.
std::string joinRemote(const std::string& base, const std::string& name);

bool validateSegment(const std::string& segment, Error& err);

// root + '/' + each validated segment.
bool joinSegments(const std::string& root,
                  const std::vector<std::string>& segments,
                  std::string& out,
                  Error& err);

// Splits "a/b/c" into segments. Leading and trailing '/' are ignored; an
// empty string yields no segments.
bool splitPath(const std::string& path,
               std::vector<std::string>& out,
               Error& err);

// Last component of a local or remote path.
bool baseName(const std::string& path, std::string& out, Error& err);

// Lowercase extension without the dot, or "" if there is none. Dot files
// such as ".bashrc" have no extension.
std::string extensionOf(const std::string& name);

} // namespace pibridge
