#pragma once

#include <ctime>
#include <optional>
#include <set>
#include <string>

namespace streamux {
namespace server {

// Read-only view of the resources a StatusEngine can serve. Names are request
// paths relative to the serving root, with or without the leading '/'.
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    virtual bool Exists(const std::string& name) const = 0;
    virtual std::optional<time_t> LastModified(const std::string& name) const = 0;
    virtual std::optional<std::string> Read(const std::string& name) const = 0;
    virtual bool IsRestricted(const std::string& name) const = 0;
};

// Serves regular files below a root directory.
class FileResourceStore : public ResourceStore {
public:
    FileResourceStore(const std::string& root, std::set<std::string> restricted);

    bool Exists(const std::string& name) const override;
    std::optional<time_t> LastModified(const std::string& name) const override;
    std::optional<std::string> Read(const std::string& name) const override;
    bool IsRestricted(const std::string& name) const override;

    const std::string& root() const { return root_; }

    // "a//./b.html" -> "a/b.html"; nullopt when a ".." segment appears.
    static std::optional<std::string> Normalize(const std::string& name);

private:
    std::optional<std::string> Resolve(const std::string& name) const;

    const std::string root_;
    const std::set<std::string> restricted_;
};

} // namespace server
} // namespace streamux
