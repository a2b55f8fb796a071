/**
 * @file tracer.hpp
 * @brief Nested timing spans grouped into traces
 *
 * WHAT IT DOES:
 * A root span opens a new trace; child spans share its trace id and point
 * to their parent. Each span carries timestamped log entries and a JSON tag
 * object, and is closed exactly once. Closed spans go to a bounded ring of
 * completed spans and, when a persist callback is set, onto a queue drained
 * by a background thread so end() never waits on storage.
 *
 * EXAMPLE:
 * Tracer tracer;
 * auto session = tracer.start_span(span::kImportSession, {{"session_id", id}});
 * auto copy = session.child(span::kImportCopy);
 * copy.log("copied", {{"files", 12}});
 * copy.end();
 * session.end(SpanStatus::Success);
 */

#pragma once

#include "ingest/core/thread_safe_queue.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ingest::monitoring {

enum class SpanStatus {
    Running,
    Success,
    Error
};

const char* to_string(SpanStatus status) noexcept;

struct SpanLog {
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    nlohmann::json fields = nlohmann::json::object();
};

struct Span {
    std::string trace_id;
    std::string span_id;
    std::optional<std::string> parent_span_id;
    std::string operation;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::optional<std::chrono::milliseconds> duration;
    SpanStatus status = SpanStatus::Running;
    nlohmann::json tags = nlohmann::json::object();
    std::vector<SpanLog> logs;
};

void to_json(nlohmann::json& j, const Span& span);

struct TraceContext {
    std::string trace_id;
    std::string span_id;
};

class Tracer;

/**
 * @brief Lightweight reference to an open span
 *
 * Copies refer to the same span. Operations on a span that has already
 * ended are ignored.
 */
class SpanHandle {
public:
    const std::string& span_id() const noexcept { return context_.span_id; }
    const std::string& trace_id() const noexcept { return context_.trace_id; }
    const TraceContext& context() const noexcept { return context_; }

    void log(const std::string& message, nlohmann::json fields = nlohmann::json::object());
    void set_tag(const std::string& key, nlohmann::json value);
    void set_tags(const nlohmann::json& tags);

    SpanHandle child(const std::string& operation, nlohmann::json tags = nlohmann::json::object());

    /// Closes the span; nullopt if it was already closed.
    std::optional<Span> end(SpanStatus status = SpanStatus::Success,
                            const nlohmann::json& tags = nlohmann::json::object());

private:
    friend class Tracer;
    SpanHandle(Tracer& tracer, TraceContext context) : tracer_(&tracer), context_(std::move(context)) {}

    Tracer* tracer_;
    TraceContext context_;
};

struct TracerOptions {
    std::size_t max_completed_spans = 1000;
};

class Tracer {
public:
    using PersistCallback = std::function<void(const Span&)>;

    explicit Tracer(TracerOptions options = {});
    ~Tracer();

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    SpanHandle start_span(const std::string& operation,
                          nlohmann::json tags = nlohmann::json::object());

    SpanHandle start_child_span(const std::string& operation,
                                const TraceContext& parent,
                                nlohmann::json tags = nlohmann::json::object());

    std::vector<Span> active_spans() const;
    std::vector<Span> trace_spans(const std::string& trace_id) const;
    std::optional<Span> find_span(const std::string& span_id) const;

    void reset();

    /**
     * @brief Registers the sink for completed spans
     *
     * Starts the persistence worker on first use. Sink failures are logged
     * and never reach the traced code.
     */
    void set_persist_callback(PersistCallback callback);

    /// Blocks until every span queued so far has been handed to the sink.
    void flush_persistence();

    /**
     * @brief Runs operation inside a root span
     *
     * The span ends Success when operation returns. If it throws, the
     * error is logged on the span, the span ends Error, and the exception
     * is rethrown.
     */
    template<typename Fn>
    auto trace(const std::string& operation, Fn&& fn, nlohmann::json tags = nlohmann::json::object()) {
        return run_traced(start_span(operation, std::move(tags)), std::forward<Fn>(fn));
    }

    template<typename Fn>
    auto trace_child(const std::string& operation, const TraceContext& parent, Fn&& fn,
                     nlohmann::json tags = nlohmann::json::object()) {
        return run_traced(start_child_span(operation, parent, std::move(tags)), std::forward<Fn>(fn));
    }

private:
    friend class SpanHandle;

    template<typename Fn>
    static auto run_traced(SpanHandle span, Fn&& fn) {
        using R = decltype(fn(span));
        try {
            if constexpr (std::is_void_v<R>) {
                fn(span);
                span.end(SpanStatus::Success);
            } else {
                R result = fn(span);
                span.end(SpanStatus::Success);
                return result;
            }
        } catch (const std::exception& e) {
            span.log("Error occurred", {{"error", e.what()}});
            span.end(SpanStatus::Error, {{"error", e.what()}});
            throw;
        } catch (...) {
            span.end(SpanStatus::Error, {{"error", "unknown exception"}});
            throw;
        }
    }

    SpanHandle create_span(const std::string& operation,
                           const std::optional<TraceContext>& parent,
                           nlohmann::json tags);
    std::string generate_id();

    void add_log(const std::string& span_id, SpanLog entry);
    void merge_tags(const std::string& span_id, const nlohmann::json& tags);
    std::optional<Span> end_span(const std::string& span_id, SpanStatus status, const nlohmann::json& tags);

    void persist_loop();

    TracerOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Span> active_;
    std::deque<Span> completed_;
    std::mt19937_64 rng_;

    std::mutex persist_mutex_;
    std::condition_variable persist_idle_cv_;
    PersistCallback persist_callback_;
    std::size_t persist_pending_ = 0;
    ThreadSafeQueue<Span> persist_queue_;
    std::thread persist_thread_;
};

} // namespace ingest::monitoring
