#pragma once

#include <cstdint>
#include <string>

#include "internal/model/job_state.hpp"

namespace transcription::db::model {

/*
  Persistent transcription job row.

  (asset_id, provider, language) is the dedup key; at most one row per key may
  be PENDING or PROCESSING. Rows in a terminal status are never updated
  except to attach a summary.
*/
struct JobRecord {
  std::string id;
  std::string asset_id;
  std::string provider;
  std::string language;
  std::string owner;

  transcription::model::JobStatus status = transcription::model::JobStatus::JOB_STATUS_PENDING;

  // SegmentList JSON, empty until COMPLETED
  std::string transcript_json;
  std::string error_message;

  // Summary JSON, empty until summarized
  std::string summary_json;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace transcription::db::model
