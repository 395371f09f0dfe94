#pragma once

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace transcription::observability {

inline constexpr const char* kInstrumentationName    = "transcription-manager";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class OtlpSignal { kTraces, kMetrics };

/*
  Exporter settings for one signal.

  Endpoint precedence: observability.otlp_endpoint, then the per-signal
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport.
*/
struct OtlpSettings {
  std::string service_name;
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
};

inline OtlpSettings ResolveOtlpSettings(const transcription::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.service_name = observability.service_name().empty() ? kInstrumentationName : observability.service_name();
  settings.http         = observability.transport() == transcription::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
    return settings;
  }

  const char* per_signal = std::getenv(signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (per_signal && *per_signal) {
    settings.endpoint = per_signal;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); shared && *shared) {
    settings.endpoint = shared;
  } else if (settings.http) {
    settings.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

} // namespace transcription::observability
