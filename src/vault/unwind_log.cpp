#include "vault/unwind_log.hpp"

#include <exception>
#include <utility>

namespace vault {

void UnwindLog::record(std::string label, Step undo) {
    steps_.push_back(Entry{std::move(label), std::move(undo)});
}

void UnwindLog::commit() noexcept {
    steps_.clear();
}

std::vector<std::string> UnwindLog::rollback() {
    std::vector<std::string> failures;
    while (!steps_.empty()) {
        Entry entry = std::move(steps_.back());
        steps_.pop_back();
        try {
            entry.undo();
        } catch (const std::exception& ex) {
            failures.push_back(entry.label + ": " + ex.what());
        } catch (...) {
            failures.push_back(entry.label + ": unknown error");
        }
    }
    return failures;
}

} // namespace vault
