#pragma once

#include "../core/logger.hpp"

#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace scriptscene::host {

// Undo log for multi-step constructions. Each completed step registers how to
// reverse it; unless commit() is reached, the destructor runs the undo steps
// in reverse order.
class RollbackScope {
public:
    RollbackScope() = default;
    ~RollbackScope() {
        if (!committed_) {
            rollback();
        }
    }

    RollbackScope(const RollbackScope&) = delete;
    RollbackScope& operator=(const RollbackScope&) = delete;

    void on_rollback(std::function<void()> undo) {
        undo_.push_back(std::move(undo));
    }

    void commit() {
        committed_ = true;
        undo_.clear();
    }

    std::size_t pending() const { return undo_.size(); }

private:
    void rollback() noexcept {
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            try {
                (*it)();
            } catch (const std::exception& e) {
                core::logf(LogLevel::Error, "abi", "rollback step failed: %s", e.what());
            }
        }
        undo_.clear();
    }

    std::vector<std::function<void()>> undo_;
    bool committed_{false};
};

} // namespace scriptscene::host
