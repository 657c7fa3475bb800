#include "streamux/server/ResourceStore.h"
#include "streamux/common/Logger.h"

#include <sys/stat.h>

#include <fstream>
#include <sstream>

namespace streamux {
namespace server {

namespace {

std::set<std::string> NormalizeAll(const std::set<std::string>& names) {
    std::set<std::string> out;
    for (const auto& n : names) {
        if (auto norm = FileResourceStore::Normalize(n)) {
            out.insert(*norm);
        } else {
            LOG_WARN << "FileResourceStore: ignoring restricted entry '" << n << "'";
        }
    }
    return out;
}

} // namespace

FileResourceStore::FileResourceStore(const std::string& root, std::set<std::string> restricted)
    : root_(root.empty() ? std::string(".") : root),
      restricted_(NormalizeAll(restricted)) {
}

std::optional<std::string> FileResourceStore::Normalize(const std::string& name) {
    std::string out;
    std::stringstream ss(name);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") return std::nullopt;
        if (!out.empty()) out.push_back('/');
        out.append(segment);
    }
    return out;
}

std::optional<std::string> FileResourceStore::Resolve(const std::string& name) const {
    std::optional<std::string> rel = Normalize(name);
    if (!rel || rel->empty()) return std::nullopt;
    return root_ + "/" + *rel;
}

bool FileResourceStore::Exists(const std::string& name) const {
    std::optional<std::string> path = Resolve(name);
    if (!path) return false;
    struct stat st;
    return ::stat(path->c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::optional<time_t> FileResourceStore::LastModified(const std::string& name) const {
    std::optional<std::string> path = Resolve(name);
    if (!path) return std::nullopt;
    struct stat st;
    if (::stat(path->c_str(), &st) != 0) return std::nullopt;
    return st.st_mtime;
}

std::optional<std::string> FileResourceStore::Read(const std::string& name) const {
    std::optional<std::string> path = Resolve(name);
    if (!path) return std::nullopt;
    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        LOG_ERROR << "FileResourceStore: cannot open " << *path;
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        LOG_ERROR << "FileResourceStore: read error on " << *path;
        return std::nullopt;
    }
    return content.str();
}

bool FileResourceStore::IsRestricted(const std::string& name) const {
    std::optional<std::string> rel = Normalize(name);
    return rel && restricted_.count(*rel) != 0;
}

} // namespace server
} // namespace streamux
