#include "settings.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace util {
void Settings::init(const std::string& executable_path) {
    std::filesystem::path exe_dir;
    if (!executable_path.empty()) {
        exe_dir = std::filesystem::path(executable_path).parent_path();
    } else {
        exe_dir = std::filesystem::current_path();
    }
    init_from_file(exe_dir / "settings.json");
}

void Settings::init_from_file(const std::filesystem::path& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_path_.empty()) {
        spdlog::warn("[Settings::init] Settings already initialized, ignoring new initialization");
        return;
    }

    file_path_ = file_path.string();
    spdlog::info("[Settings::init] Settings file path: {}", file_path_);

    load();
}

json Settings::default_settings() {
    return {
        {"server", {{"host", "127.0.0.1"}, {"port", 8000}, {"api_prefix", "/api/v1"}}},
        {"upload",
         {{"chunk_size", 5 * 1024 * 1024},
          {"request_timeout_ms", 60000},
          {"completion_timeout_ms", 0},
          {"allowed_extensions", {".pdf", ".doc", ".docx", ".png", ".jpg", ".jpeg", ".txt"}}}},
        {"notification", {{"reconnect_attempts", 0}, {"reconnect_delay_ms", 2000}}},
        {"log_level", "info"},
    };
}

void Settings::load() {
    if (std::filesystem::exists(file_path_)) {
        std::ifstream file(file_path_);
        if (!file.is_open()) {
            spdlog::error("[Settings::load] Failed to open settings file: {}", file_path_);
            create_default();
            return;
        }
        settings_ = json::parse(file, nullptr, false);
        if (settings_.is_discarded() || !settings_.is_object()) {
            spdlog::error("[Settings::load] Settings file is not a JSON object, using defaults: {}",
                          file_path_);
            create_default();
            return;
        }
        spdlog::info("[Settings::load] Settings loaded from {}", file_path_);
    } else {
        spdlog::warn("[Settings::load] Settings file not found, creating default: {}", file_path_);
        create_default();
        save_internal();
    }
}

void Settings::save_internal() {
    std::ofstream file(file_path_);
    if (!file.is_open()) {
        spdlog::error("[Settings::save_internal] Failed to create settings file: {}", file_path_);
        return;
    }
    file << settings_.dump(4);
    spdlog::info("[Settings::save_internal] Default settings created at {}", file_path_);
}

} // namespace util
