#include "../../include/action_log.hpp"
#include "../../include/event_bus.hpp"
#include <stdexcept>

namespace picbatch {

ActionLog::ActionLog(const std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ActionLog capacity must be positive");
    }
}

void ActionLog::append(std::string message) {
    entries_.push_back(std::move(message));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

void ActionLog::record(const BatchCompleteEvent& event) {
    append(describe(event));
}

void ActionLog::attach(EventBus& bus) {
    bus.subscribe<BatchCompleteEvent>([this](const BatchCompleteEvent& e) { record(e); });
}

std::vector<std::string> ActionLog::entries() const {
    return {entries_.begin(), entries_.end()};
}

std::string ActionLog::describe(const BatchCompleteEvent& event) {
    std::string msg = "Processed " + std::to_string(event.input_count) + " images → " +
                      std::to_string(event.output_count) + " outputs, format=" +
                      image_format_extension(event.format) + ".";
    if (event.failed_count > 0) {
        msg += " " + std::to_string(event.failed_count) + " failed.";
    }
    return msg;
}

} // namespace picbatch
