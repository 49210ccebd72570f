#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if ONLYONE_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

// W3C trace context carried in the "traceparent" header:
// "00-<32 hex trace id>-<16 hex span id>-<2 hex flags>".
struct TraceContext {
    std::string traceId;
    std::string spanId;
    bool sampled = true;

    static TraceContext Generate();
    // Returns false for malformed headers and all-zero ids.
    static bool Parse(const std::string& header, TraceContext& outContext);

    bool Valid() const { return traceId.size() == 32 && spanId.size() == 16; }
    std::string ToHeader() const;
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const { return enabled_; }
    void Shutdown();

private:
    friend class ScopedSpan;

    Tracer() = default;

    bool enabled_ = false;
    std::string serviceName_;
#if ONLYONE_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// One client-side operation. Ends on scope exit, failed unless MarkSuccess()
// was called. Without an exporter it still yields a fresh traceparent.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void SetAttribute(const std::string& key, const std::string& value);
    void SetAttribute(const std::string& key, int64_t value);
    void MarkSuccess() { success_ = true; }

    const TraceContext& Context() const { return context_; }
    std::string TraceParent() const { return context_.ToHeader(); }

private:
    TraceContext context_;
    bool success_ = false;
#if ONLYONE_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
#endif
};
