#include "ConfigStore.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mcphub {

ConfigStore::ConfigStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        throw std::invalid_argument("Config directory cannot be empty");
    }
}

void ConfigStore::ensure_directory() const {
    if (!std::filesystem::exists(directory_)) {
        std::filesystem::create_directories(directory_);
        spdlog::debug("Created config directory {}", directory_.string());
    }
}

std::vector<std::filesystem::path> ConfigStore::list_files() const {
    std::vector<std::filesystem::path> files;

    if (!std::filesystem::is_directory(directory_)) {
        return files;
    }

    try {
        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Error scanning config directory {}: {}", directory_.string(), e.what());
    }

    std::sort(files.begin(), files.end());
    return files;
}

ServiceConfig ConfigStore::read(const std::filesystem::path& path) const {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return json::parse(buffer.str()).get<ServiceConfig>();
}

void ConfigStore::write(const ServiceConfig& config) const {
    ensure_directory();

    auto target = path_for(config.name);
    auto temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write " + temp.string());
        }
        file << json(config).dump(2) << '\n';
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed writing " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw std::runtime_error("Cannot commit " + target.string());
    }

    spdlog::debug("Wrote service record {}", target.string());
}

bool ConfigStore::remove(const std::string& name) const {
    std::error_code ec;
    bool removed = std::filesystem::remove(path_for(name), ec);
    if (ec) {
        throw std::runtime_error("Cannot remove record for " + name + ": " + ec.message());
    }
    return removed;
}

std::filesystem::path ConfigStore::path_for(const std::string& name) const {
    return directory_ / file_name_for(name);
}

std::string ConfigStore::file_name_for(const std::string& name) {
    static const char HEX[] = "0123456789ABCDEF";

    std::string file_name;
    file_name.reserve(name.size() + 5);

    // "." and ".." would resolve to directories, so their dots are escaped too
    bool only_dots = name.find_first_not_of('.') == std::string::npos;

    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool plain = (uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') ||
                     (uc >= '0' && uc <= '9') || c == '_' || c == '-' ||
                     (c == '.' && !only_dots);
        if (plain) {
            file_name += c;
        } else {
            file_name += '%';
            file_name += HEX[uc >> 4];
            file_name += HEX[uc & 0x0F];
        }
    }

    return file_name + ".json";
}

} // namespace mcphub
