#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if CTCOPY_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    std::string name;
    std::string traceparent;
    bool valid = false;
#if CTCOPY_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void SetFlag(SpanHandle& handle, const std::string& key, bool value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if CTCOPY_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends its span on scope exit; the span is marked failed unless Succeed() was called.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    SpanHandle& Handle() { return handle_; }
    const std::string& TraceParent() const { return handle_.traceparent; }

    void Set(const std::string& key, const std::string& value);
    void Set(const std::string& key, int64_t value);
    void SetFlag(const std::string& key, bool value);

    void Succeed() { success_ = true; }

private:
    SpanHandle handle_;
    bool success_ = false;
};
