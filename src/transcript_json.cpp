#include "transcript_json.h"

#include <chrono>
#include <ctime>

using json = nlohmann::json;

namespace {

json word_to_json(const Word& w) {
  json obj;
  obj["word"] = w.text;
  if (w.interval) {
    obj["start"] = w.interval->start;
    obj["end"] = w.interval->end;
  } else {
    obj["start"] = nullptr;
    obj["end"] = nullptr;
  }
  if (w.confidence) obj["score"] = *w.confidence;
  if (w.speaker) obj["speaker"] = *w.speaker;
  return obj;
}

const RepairKind kAllRepairKinds[] = {
    RepairKind::ApproximatedWords,    RepairKind::TextReplaced,     RepairKind::OrphanSegment,
    RepairKind::InterpolatedInterval, RepairKind::InvertedInterval, RepairKind::ClampedToSegment,
    RepairKind::MonotonicClip,        RepairKind::SpeakerInherited,
};

}  // namespace

json transcript_to_json(const Transcript& t) {
  json j;
  j["language"] = t.language;
  j["source_engine"] = source_engine_name(t.source_engine);
  j["diarized"] = t.diarized;
  j["word_timing"] = word_timing_name(t.word_timing);
  j["segments"] = json::array();

  for (const auto& seg : t.segments) {
    json seg_obj;
    seg_obj["start"] = seg.interval.start;
    seg_obj["end"] = seg.interval.end;
    seg_obj["text"] = seg.text;
    if (seg.speaker) seg_obj["speaker"] = *seg.speaker;
    seg_obj["words"] = json::array();
    for (const auto& w : seg.words) seg_obj["words"].push_back(word_to_json(w));
    j["segments"].push_back(seg_obj);
  }
  return j;
}

std::string format_transcript_json(const Transcript& t) { return transcript_to_json(t).dump(2) + "\n"; }

std::string format_meta_json(const RunMeta& meta, const SyncResult& sync) {
  json j;
  j["input"] = meta.input;
  j["created_at"] = meta.created_at;
  j["engine"]["requested"] = meta.engine_requested;
  j["engine"]["use_aligned"] = meta.decision.use_aligned;
  j["engine"]["use_diarization"] = meta.decision.use_diarization;
  j["engine"]["aligned_used"] = meta.aligned_used;
  j["engine"]["reason"] = meta.decision.reason;
  if (!meta.fallback_reason.empty()) j["engine"]["fallback_reason"] = meta.fallback_reason;

  const auto& t = sync.transcript;
  j["transcript"]["language"] = t.language;
  j["transcript"]["segments"] = t.segments.size();
  j["transcript"]["words"] = t.word_count();
  j["transcript"]["diarized"] = t.diarized;
  j["transcript"]["word_timing"] = word_timing_name(t.word_timing);

  j["sync"]["clipped"] = sync.clipped_count;
  j["sync"]["elements"] = sync.element_count;
  j["sync"]["clip_ratio"] = sync.clip_ratio();
  for (RepairKind k : kAllRepairKinds) j["sync"]["repairs"][repair_kind_name(k)] = sync.count(k);

  j["metadata"]["processing_time"] = meta.processing_time;
  return j.dump(2) + "\n";
}

std::string utc_timestamp_now() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}
