#include <dotkeep/prompt.hpp>
#include <dotkeep/log.hpp>
#include <dotkeep/process.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

namespace dotkeep {

CommandPager::CommandPager(std::string command) : command_(std::move(command)) {}

Status CommandPager::page(const std::filesystem::path& script, const std::string&) {
    auto args = split_command(command_);
    if (args.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "no pager command configured"};
    }
    args.push_back(script.string());

    auto rc = run_interactive(args);
    if (rc.is_err()) return std::move(rc).error();
    if (rc.value() != 0) {
        return DotkeepError{DotkeepError::Execution,
            "pager '" + command_ + "' exited with status " + std::to_string(rc.value())};
    }
    return ok_status();
}

StreamPager::StreamPager(std::ostream& out) : out_(out) {}

Status StreamPager::page(const std::filesystem::path& script, const std::string& contents) {
    out_ << "==> " << script.string() << " <==\n";

    std::istringstream lines(contents);
    std::string line;
    int number = 0;
    while (std::getline(lines, line)) {
        out_ << std::setw(4) << ++number << " | " << line << '\n';
    }
    out_.flush();

    if (!out_) {
        return DotkeepError{DotkeepError::IO, "failed to display '" + script.string() + "'"};
    }
    return ok_status();
}

StreamPrompter::StreamPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

Result<bool> StreamPrompter::confirm(const std::string& question) {
    std::string answer;
    while (true) {
        out_ << question << ' ';
        out_.flush();

        if (!std::getline(in_, answer)) {
            out_ << '\n';
            log::debug("no answer on input, treating as refusal");
            return Result<bool>::ok(false);
        }

        answer.erase(std::remove_if(answer.begin(), answer.end(),
                                    [](unsigned char c) { return std::isspace(c); }),
                     answer.end());
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (answer == "y" || answer == "yes" || answer == "a" || answer == "accept") {
            return Result<bool>::ok(true);
        }
        if (answer == "n" || answer == "no" || answer == "d" || answer == "deny") {
            return Result<bool>::ok(false);
        }
        out_ << "please answer 'accept' or 'deny'\n";
    }
}

} // namespace dotkeep
