#pragma once

#include <dotkeep/result.hpp>
#include <dotkeep/toml/document.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace dotkeep {

// Persistence capability for the configuration document and other small
// text files (ignore files). Writes are all-or-nothing: a failed write leaves
// the previous contents of the target untouched.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual Result<std::string> read_text(const std::filesystem::path& path) const = 0;
    virtual Status write_text(const std::filesystem::path& path, const std::string& text) = 0;

    // Read and parse a document. IO when unreadable, Parse on bad syntax.
    Result<ConfigDocument> read(const std::filesystem::path& path) const;

    Status write(const ConfigDocument& doc, const std::filesystem::path& path);
};

// Store backed by the real filesystem. Writes go to a temporary file in the
// target's directory, are fsynced, then renamed over the target.
class FileStore : public DocumentStore {
public:
    bool exists(const std::filesystem::path& path) const override;
    Result<std::string> read_text(const std::filesystem::path& path) const override;
    Status write_text(const std::filesystem::path& path, const std::string& text) override;

protected:
    // Write all of `data` to the open temporary file
    virtual Status write_bytes(int fd, const std::string& data,
                               const std::filesystem::path& tmp_path);
};

// In-memory store for tests
class MemoryStore : public DocumentStore {
public:
    bool exists(const std::filesystem::path& path) const override;
    Result<std::string> read_text(const std::filesystem::path& path) const override;
    Status write_text(const std::filesystem::path& path, const std::string& text) override;

    void put(const std::filesystem::path& path, std::string text);
    std::optional<std::string> get(const std::filesystem::path& path) const;

    // Make every subsequent write fail with an IO error
    void set_fail_writes(bool fail) { fail_writes_ = fail; }
    int write_count() const { return write_count_; }

private:
    std::map<std::filesystem::path, std::string> files_;
    bool fail_writes_ = false;
    int write_count_ = 0;
};

} // namespace dotkeep
