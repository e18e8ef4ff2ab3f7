#pragma once

#include <dotkeep/result.hpp>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace dotkeep {

// Shows a hook script to the user before they are asked about it
class Pager {
public:
    virtual ~Pager() = default;
    virtual Status page(const std::filesystem::path& script, const std::string& contents) = 0;
};

// Asks the user a yes/no question
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual Result<bool> confirm(const std::string& question) = 0;
};

// Runs an external pager program (e.g. "less -R") on the script file
class CommandPager : public Pager {
public:
    explicit CommandPager(std::string command);
    Status page(const std::filesystem::path& script, const std::string& contents) override;

private:
    std::string command_;
};

// Writes the script to a stream with line numbers
class StreamPager : public Pager {
public:
    explicit StreamPager(std::ostream& out);
    Status page(const std::filesystem::path& script, const std::string& contents) override;

private:
    std::ostream& out_;
};

// Line-based prompt. Accepts y/yes/a/accept and n/no/d/deny; anything else
// asks again. End of input counts as a refusal.
class StreamPrompter : public Prompter {
public:
    StreamPrompter(std::istream& in, std::ostream& out);
    Result<bool> confirm(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dotkeep
