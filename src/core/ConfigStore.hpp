#pragma once

#include "core/ServiceConfig.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace mcphub {

/**
 * @brief File-backed store holding one JSON record per service
 *
 * Each service lives in <directory>/<name>.json. Writes go to a temporary
 * file first and are renamed into place, so a reader never sees a
 * half-written record.
 */
class ConfigStore {
public:
    /**
     * @brief Construct store rooted at a directory (not created until needed)
     * @param directory Directory holding the service records
     */
    explicit ConfigStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const { return directory_; }

    /**
     * @brief Create the directory (and parents) if missing
     * @throws std::filesystem::filesystem_error on failure
     */
    void ensure_directory() const;

    /**
     * @brief List record files in the directory
     * @return Sorted paths of *.json files, empty if the directory is absent
     */
    std::vector<std::filesystem::path> list_files() const;

    /**
     * @brief Read and decode a single record
     * @param path Record file
     * @throws std::runtime_error if the file cannot be read
     * @throws nlohmann::json::exception / std::invalid_argument if malformed
     */
    ServiceConfig read(const std::filesystem::path& path) const;

    /**
     * @brief Persist a record, replacing any previous version
     * @throws std::runtime_error if the file cannot be written
     */
    void write(const ServiceConfig& config) const;

    /**
     * @brief Delete the record for a service
     * @return true if a file was removed, false if there was none
     * @throws std::runtime_error if the file exists but cannot be deleted
     */
    bool remove(const std::string& name) const;

    /**
     * @brief Path of the record file for a service name
     */
    std::filesystem::path path_for(const std::string& name) const;

    /**
     * @brief File name for a service name
     *
     * Characters outside [A-Za-z0-9._-] are percent-encoded (%XX), so a name
     * can never escape the directory and distinct names never share a file.
     */
    static std::string file_name_for(const std::string& name);

private:
    std::filesystem::path directory_;
};

} // namespace mcphub
