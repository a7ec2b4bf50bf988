#pragma once

#include <functional>
#include <string>
#include <vector>

namespace vault {

// Compensating actions for one vault operation, replayed newest-first when
// the operation fails part way through.
class UnwindLog {
public:
    using Step = std::function<void()>;

    UnwindLog() = default;
    UnwindLog(const UnwindLog&) = delete;
    UnwindLog& operator=(const UnwindLog&) = delete;

    void record(std::string label, Step undo);

    // Drops all recorded steps; the operation's effects stand.
    void commit() noexcept;

    // Runs every recorded step. Returns "label: reason" for each step that threw.
    std::vector<std::string> rollback();

    [[nodiscard]] std::size_t size() const noexcept { return steps_.size(); }

private:
    struct Entry {
        std::string label;
        Step undo;
    };

    std::vector<Entry> steps_;
};

} // namespace vault
