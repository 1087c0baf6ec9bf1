#include "cli_history.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace nb {

CliHistory::CliHistory() : CliHistory(DefaultHistoryFilePath()) {}

CliHistory::CliHistory(std::filesystem::path file) : history_file_path_(std::move(file)) {
    Load();
}

std::filesystem::path CliHistory::DefaultHistoryFilePath() {
    std::filesystem::path home_dir;
#ifdef _WIN32
    char path[MAX_PATH];
    if (SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path) == S_OK) {
        home_dir = path;
    }
#else
    const char* home = getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
    if (home) {
        home_dir = home;
    }
#endif
    if (home_dir.empty()) {
        return ".nativebridge_history"; // fallback to current dir
    }
    return home_dir / ".nativebridge_history";
}

void CliHistory::Load() {
    std::ifstream file(history_file_path_);
    if (!file) return;

    history_.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            history_.push_back(line);
        }
    }
    Trim();
}

void CliHistory::Save() const {
    std::ofstream file(history_file_path_);
    if (!file) {
        std::cerr << "Warning: Could not save command history to " << history_file_path_ << std::endl;
        return;
    }
    for (const auto& line : history_) {
        file << line << "\n";
    }
}

void CliHistory::Add(const std::string& command) {
    if (command.empty()) return;

    // Don't add if it's the same as the last command
    if (!history_.empty() && history_.back() == command) return;

    history_.push_back(command);
    Trim();
}

void CliHistory::Trim() {
    if (history_.size() > max_size_) {
        history_.erase(history_.begin(), history_.begin() + (history_.size() - max_size_));
    }
}

void CliHistory::SetMaxSize(size_t size) {
    max_size_ = size;
    Trim();
}

} // namespace nb
