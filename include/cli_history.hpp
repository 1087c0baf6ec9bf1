#pragma once
#include <string>
#include <vector>
#include <filesystem>

namespace nb {

// REPL command history persisted to ~/.nativebridge_history.
class CliHistory {
public:
    CliHistory();
    explicit CliHistory(std::filesystem::path file);

    void Load();
    void Save() const;
    void Add(const std::string& command);

    void SetMaxSize(size_t size);
    const std::vector<std::string>& Entries() const { return history_; }

    // Expose the resolved history file path for UI/diagnostics.
    const std::filesystem::path& Path() const { return history_file_path_; }

private:
    static std::filesystem::path DefaultHistoryFilePath();
    void Trim();

    std::vector<std::string> history_;
    size_t max_size_ = 1000;
    std::filesystem::path history_file_path_;
};

} // namespace nb
