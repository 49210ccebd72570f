#include "Tracing.hpp"

#include <random>

#if ONLYONE_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kDefaultServiceName = "onlyone";
constexpr const char* kHexDigits = "0123456789abcdef";

std::string RandomHexId(size_t length) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string id(length, '0');
    for (auto& ch : id) {
        ch = kHexDigits[digit(rng)];
    }
    // All-zero ids are invalid in W3C trace context.
    if (id.find_first_not_of('0') == std::string::npos) {
        id.back() = '1';
    }
    return id;
}

bool IsLowerHex(const std::string& text) {
    return !text.empty() && text.find_first_not_of(kHexDigits) == std::string::npos;
}

bool IsAllZero(const std::string& text) {
    return text.find_first_not_of('0') == std::string::npos;
}

#if ONLYONE_ENABLE_OTEL
TraceContext FromSpanContext(const opentelemetry::trace::SpanContext& spanContext) {
    if (!spanContext.IsValid()) {
        return TraceContext::Generate();
    }

    char traceId[32];
    char spanId[16];
    spanContext.trace_id().ToLowerBase16(traceId);
    spanContext.span_id().ToLowerBase16(spanId);

    TraceContext context;
    context.traceId.assign(traceId, sizeof(traceId));
    context.spanId.assign(spanId, sizeof(spanId));
    context.sampled = spanContext.trace_flags().IsSampled();
    return context;
}
#endif
} // namespace

TraceContext TraceContext::Generate() {
    TraceContext context;
    context.traceId = RandomHexId(32);
    context.spanId = RandomHexId(16);
    context.sampled = true;
    return context;
}

bool TraceContext::Parse(const std::string& header, TraceContext& outContext) {
    // version(2) - trace id(32) - span id(16) - flags(2)
    if (header.size() != 55 || header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return false;
    }

    const std::string version = header.substr(0, 2);
    const std::string traceId = header.substr(3, 32);
    const std::string spanId = header.substr(36, 16);
    const std::string flags = header.substr(53, 2);
    if (!IsLowerHex(version) || version == "ff" || !IsLowerHex(traceId) || !IsLowerHex(spanId)
        || !IsLowerHex(flags) || IsAllZero(traceId) || IsAllZero(spanId)) {
        return false;
    }

    outContext.traceId = traceId;
    outContext.spanId = spanId;
    outContext.sampled = (std::stoi(flags, nullptr, 16) & 0x01) != 0;
    return true;
}

std::string TraceContext::ToHeader() const {
    if (!Valid()) {
        return {};
    }
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    serviceName_ = config.serviceName.empty() ? kDefaultServiceName : config.serviceName;
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if ONLYONE_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::move(exporter),
        opentelemetry::sdk::trace::BatchSpanProcessorOptions{});
    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", serviceName_}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider_));
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(serviceName_);
    enabled_ = true;
#else
    enabled_ = false;
#endif
}

void Tracer::Shutdown() {
#if ONLYONE_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
        provider_.reset();
    }
    tracer_ = nullptr;
#endif
    enabled_ = false;
}

ScopedSpan::ScopedSpan(const std::string& name) {
#if ONLYONE_ENABLE_OTEL
    Tracer& tracer = Tracer::Instance();
    if (tracer.enabled_ && tracer.tracer_) {
        span_ = tracer.tracer_->StartSpan(name);
        context_ = FromSpanContext(span_->GetContext());
        return;
    }
#else
    (void)name;
#endif
    context_ = TraceContext::Generate();
}

ScopedSpan::~ScopedSpan() {
#if ONLYONE_ENABLE_OTEL
    if (span_) {
        span_->SetStatus(success_ ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        span_->End();
    }
#endif
}

void ScopedSpan::SetAttribute(const std::string& key, const std::string& value) {
#if ONLYONE_ENABLE_OTEL
    if (span_) {
        span_->SetAttribute(key, value);
    }
#else
    (void)key;
    (void)value;
#endif
}

void ScopedSpan::SetAttribute(const std::string& key, int64_t value) {
#if ONLYONE_ENABLE_OTEL
    if (span_) {
        span_->SetAttribute(key, value);
    }
#else
    (void)key;
    (void)value;
#endif
}
