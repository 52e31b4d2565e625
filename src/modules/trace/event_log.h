// modules/trace/event_log.h
#ifndef PLANFLOW_MODULES_TRACE_EVENT_LOG_H
#define PLANFLOW_MODULES_TRACE_EVENT_LOG_H

#include "core/types/plan.h" // 引入 NodeId
#include <nlohmann/json.hpp>
#include <deque>
#include <string>
#include <string_view>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace planflow {

enum class EventType : uint8_t {
    PLAN_ACTIVATED,
    NODE_ENTERED,
    NODE_VERIFIED,   // fields: outcome
    RETRY_TRIGGERED,
    EDGE_FOLLOWED,   // fields: from, to, condition
    PLAN_EXPIRED,
    PLAN_COMPLETED,
    PLAN_ESCALATED   // fields: reason, pace_level
};

std::string_view to_string(EventType type);
std::optional<EventType> parse_event_type(std::string_view s);

struct TraversalEvent {
    EventType type;
    int turn = 0;   // traversal turn at emission time
    NodeId node;
    nlohmann::json fields = nlohmann::json::object();
};

// Append-only trace of traversal events; oldest entries are evicted once the
// capacity is reached.
class EventLog {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 50;

    explicit EventLog(std::size_t capacity = DEFAULT_CAPACITY);

    void emit(EventType type, int turn, NodeId node, nlohmann::json fields = nlohmann::json::object());

    // Outcome of the newest node_verified event still in the log.
    std::optional<std::string> last_outcome() const;

    const std::deque<TraversalEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return events_.empty(); }
    void clear() { events_.clear(); }

private:
    std::deque<TraversalEvent> events_;
    std::size_t capacity_;
};

void to_json(nlohmann::json& j, const TraversalEvent& event);
void from_json(const nlohmann::json& j, TraversalEvent& event);
void to_json(nlohmann::json& j, const EventLog& log);
void from_json(const nlohmann::json& j, EventLog& log);

} // namespace planflow

#endif // PLANFLOW_MODULES_TRACE_EVENT_LOG_H
