/**
 * @file action_log.hpp
 * @brief Bounded, append-only history of batch runs shown to the user.
 */

#ifndef PICBATCH_ACTION_LOG_HPP
#define PICBATCH_ACTION_LOG_HPP

#include "events.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace picbatch {

class EventBus;

/**
 * @brief Keeps the most recent messages, dropping the oldest beyond capacity.
 */
class ActionLog {
public:
    static constexpr std::size_t kDefaultCapacity = 50;

    /// @throws std::invalid_argument if @p capacity is zero.
    explicit ActionLog(std::size_t capacity = kDefaultCapacity);

    void append(std::string message);

    /// Appends the summary line for a finished batch.
    void record(const BatchCompleteEvent& event);

    /// Subscribes record() to BatchCompleteEvent on @p bus. The log must outlive the bus.
    void attach(EventBus& bus);

    /// @return Messages, oldest first.
    [[nodiscard]] std::vector<std::string> entries() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @return "Processed N images → M outputs, format=ext."
    static std::string describe(const BatchCompleteEvent& event);

private:
    std::size_t capacity_;
    std::deque<std::string> entries_;
};

} // namespace picbatch

#endif // PICBATCH_ACTION_LOG_HPP
