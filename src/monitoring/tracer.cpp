#include "ingest/monitoring/tracer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace ingest::monitoring {
namespace {

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

} // namespace

const char* to_string(SpanStatus status) noexcept {
    switch (status) {
        case SpanStatus::Running: return "running";
        case SpanStatus::Success: return "success";
        case SpanStatus::Error: return "error";
    }
    return "running";
}

void to_json(nlohmann::json& j, const Span& span) {
    nlohmann::json logs = nlohmann::json::array();
    for (const auto& entry : span.logs) {
        logs.push_back({
            {"timestamp", to_epoch_ms(entry.timestamp)},
            {"message", entry.message},
            {"fields", entry.fields}
        });
    }

    j = nlohmann::json{
        {"trace_id", span.trace_id},
        {"span_id", span.span_id},
        {"parent_span_id", span.parent_span_id ? nlohmann::json(*span.parent_span_id) : nlohmann::json()},
        {"operation", span.operation},
        {"start_time", to_epoch_ms(span.start_time)},
        {"end_time", span.end_time ? nlohmann::json(to_epoch_ms(*span.end_time)) : nlohmann::json()},
        {"duration_ms", span.duration ? nlohmann::json(span.duration->count()) : nlohmann::json()},
        {"status", to_string(span.status)},
        {"tags", span.tags},
        {"logs", logs}
    };
}

// ════════════════════════════════════════════════════════
// SpanHandle
// ════════════════════════════════════════════════════════

void SpanHandle::log(const std::string& message, nlohmann::json fields) {
    tracer_->add_log(context_.span_id, SpanLog{std::chrono::system_clock::now(), message, std::move(fields)});
}

void SpanHandle::set_tag(const std::string& key, nlohmann::json value) {
    tracer_->merge_tags(context_.span_id, nlohmann::json{{key, std::move(value)}});
}

void SpanHandle::set_tags(const nlohmann::json& tags) {
    tracer_->merge_tags(context_.span_id, tags);
}

SpanHandle SpanHandle::child(const std::string& operation, nlohmann::json tags) {
    return tracer_->start_child_span(operation, context_, std::move(tags));
}

std::optional<Span> SpanHandle::end(SpanStatus status, const nlohmann::json& tags) {
    return tracer_->end_span(context_.span_id, status, tags);
}

// ════════════════════════════════════════════════════════
// Tracer
// ════════════════════════════════════════════════════════

Tracer::Tracer(TracerOptions options)
    : options_(options),
      rng_(std::random_device{}()) {}

Tracer::~Tracer() {
    persist_queue_.shutdown();
    if (persist_thread_.joinable()) {
        persist_thread_.join();
    }
}

SpanHandle Tracer::start_span(const std::string& operation, nlohmann::json tags) {
    return create_span(operation, std::nullopt, std::move(tags));
}

SpanHandle Tracer::start_child_span(const std::string& operation,
                                    const TraceContext& parent,
                                    nlohmann::json tags) {
    return create_span(operation, parent, std::move(tags));
}

std::vector<Span> Tracer::active_spans() const {
    std::lock_guard lock(mutex_);
    std::vector<Span> spans;
    spans.reserve(active_.size());
    for (const auto& [id, span] : active_) {
        spans.push_back(span);
    }
    return spans;
}

std::vector<Span> Tracer::trace_spans(const std::string& trace_id) const {
    std::lock_guard lock(mutex_);
    std::vector<Span> spans;
    for (const auto& span : completed_) {
        if (span.trace_id == trace_id) {
            spans.push_back(span);
        }
    }
    return spans;
}

std::optional<Span> Tracer::find_span(const std::string& span_id) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(span_id);
    if (it != active_.end()) {
        return it->second;
    }
    auto done = std::find_if(completed_.begin(), completed_.end(),
                             [&span_id](const Span& span) { return span.span_id == span_id; });
    if (done != completed_.end()) {
        return *done;
    }
    return std::nullopt;
}

void Tracer::reset() {
    std::lock_guard lock(mutex_);
    active_.clear();
    completed_.clear();
}

void Tracer::set_persist_callback(PersistCallback callback) {
    std::lock_guard lock(persist_mutex_);
    persist_callback_ = std::move(callback);
    if (!persist_thread_.joinable()) {
        persist_thread_ = std::thread([this]() { persist_loop(); });
    }
}

void Tracer::flush_persistence() {
    std::unique_lock lock(persist_mutex_);
    persist_idle_cv_.wait(lock, [this]() { return persist_pending_ == 0; });
}

SpanHandle Tracer::create_span(const std::string& operation,
                               const std::optional<TraceContext>& parent,
                               nlohmann::json tags) {
    Span span;
    span.operation = operation;
    span.start_time = std::chrono::system_clock::now();
    span.tags = tags.is_object() ? std::move(tags) : nlohmann::json::object();

    std::lock_guard lock(mutex_);
    span.span_id = generate_id();
    if (parent) {
        span.trace_id = parent->trace_id;
        span.parent_span_id = parent->span_id;
    } else {
        span.trace_id = generate_id();
    }

    TraceContext context{span.trace_id, span.span_id};
    active_.emplace(span.span_id, std::move(span));
    return SpanHandle(*this, std::move(context));
}

std::string Tracer::generate_id() {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(rng_()));
    return buffer;
}

void Tracer::add_log(const std::string& span_id, SpanLog entry) {
    std::lock_guard lock(mutex_);
    auto it = active_.find(span_id);
    if (it != active_.end()) {
        it->second.logs.push_back(std::move(entry));
    }
}

void Tracer::merge_tags(const std::string& span_id, const nlohmann::json& tags) {
    if (!tags.is_object()) {
        return;
    }
    std::lock_guard lock(mutex_);
    auto it = active_.find(span_id);
    if (it != active_.end()) {
        it->second.tags.update(tags);
    }
}

std::optional<Span> Tracer::end_span(const std::string& span_id, SpanStatus status, const nlohmann::json& tags) {
    Span finished;
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(span_id);
        if (it == active_.end()) {
            return std::nullopt;
        }

        finished = std::move(it->second);
        active_.erase(it);

        finished.end_time = std::chrono::system_clock::now();
        finished.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            *finished.end_time - finished.start_time);
        finished.status = status;
        if (tags.is_object()) {
            finished.tags.update(tags);
        }

        completed_.push_back(finished);
        while (completed_.size() > options_.max_completed_spans) {
            completed_.pop_front();
        }
    }

    {
        std::lock_guard lock(persist_mutex_);
        if (persist_callback_) {
            ++persist_pending_;
            persist_queue_.push(finished);
        }
    }
    return finished;
}

void Tracer::persist_loop() {
    while (auto span = persist_queue_.pop()) {
        PersistCallback callback;
        {
            std::lock_guard lock(persist_mutex_);
            callback = persist_callback_;
        }

        if (callback) {
            try {
                callback(*span);
            } catch (const std::exception& e) {
                spdlog::error("[Tracer] Failed to persist span {}: {}", span->span_id, e.what());
            } catch (...) {
                spdlog::error("[Tracer] Failed to persist span {}: unknown exception", span->span_id);
            }
        }

        {
            std::lock_guard lock(persist_mutex_);
            --persist_pending_;
        }
        persist_idle_cv_.notify_all();
    }
}

} // namespace ingest::monitoring
