#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

using namespace nlohmann;

namespace util {
class Settings {
  public:
    static Settings& instance() {
        static Settings instance;
        return instance;
    }

    // Resolves settings.json next to the executable, or the working directory when empty.
    void init(const std::string& executable_path = "");
    void init_from_file(const std::filesystem::path& file_path);

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    json get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    static json default_settings();

  private:
    Settings() = default;
    ~Settings() = default;

    void load();
    void create_default() { settings_ = default_settings(); }
    void save_internal();

    std::string file_path_;
    json settings_;
    mutable std::mutex mutex_;
};
} // namespace util
