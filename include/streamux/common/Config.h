#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "streamux/common/noncopyable.h"

namespace streamux {
namespace common {

// INI-style settings shared by the server and proxy executables.
//
//   [section]
//   key = value      ; comment
//
// Keys outside any section land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    void Clear();

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    bool HasKey(const std::string& section, const std::string& key) const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // TCP port in 1..65535; nullopt (and a WARN) for anything else.
    std::optional<uint16_t> GetPort(const std::string& section, const std::string& key, int defaultVal) const;

    // Comma-separated value split into trimmed, non-empty items.
    std::vector<std::string> GetList(const std::string& section, const std::string& key) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    Config() = default;
    static std::string Trim(const std::string& s);
    static Settings Parse(std::istream& in);

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace streamux
