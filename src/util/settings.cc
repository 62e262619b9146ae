#include "settings.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace util {

namespace {
template<typename T>
void read(const json& section, const char* key, T& field) {
    if (section.contains(key)) {
        field = section.at(key).get<T>();
    }
}

const json& section_of(const json& j, const char* name) {
    static const json kEmpty = json::object();
    if (j.is_object() && j.contains(name) && j.at(name).is_object()) {
        return j.at(name);
    }
    return kEmpty;
}
} // namespace

TransferSettings TransferSettings::from_json(const json& j) {
    TransferSettings s;

    const auto& c = section_of(j, "chunking");
    read(c, "adaptive", s.chunking.adaptive);
    read(c, "min_chunk_size", s.chunking.min_chunk_size);
    read(c, "max_chunk_size", s.chunking.max_chunk_size);
    read(c, "default_chunk_size", s.chunking.default_chunk_size);
    read(c, "adaptation_rate", s.chunking.adaptation_rate);
    read(c, "stability_threshold_ms", s.chunking.stability_threshold_ms);
    read(c, "quality_window", s.chunking.quality_window);
    read(c, "target_rtt_ms", s.chunking.target_rtt_ms);
    read(c, "target_buffer_utilization", s.chunking.target_buffer_utilization);
    read(c, "bandwidth_utilization_target", s.chunking.bandwidth_utilization_target);
    read(c, "buffer_capacity", s.chunking.buffer_capacity);
    read(c, "oversize_reduction", s.chunking.oversize_reduction);
    read(c, "min_change_ratio", s.chunking.min_change_ratio);
    read(c, "min_confidence", s.chunking.min_confidence);

    const auto& p = section_of(j, "pacing");
    read(p, "constrained_peer", s.pacing.constrained_peer);
    read(p, "high_water_mark", s.pacing.high_water_mark);
    read(p, "constrained_high_water_mark", s.pacing.constrained_high_water_mark);
    read(p, "low_threshold", s.pacing.low_threshold);
    read(p, "constrained_low_threshold", s.pacing.constrained_low_threshold);
    read(p, "wait_timeout_ms", s.pacing.wait_timeout_ms);
    read(p, "drain_poll_ms", s.pacing.drain_poll_ms);
    read(p, "drain_timeout_ms", s.pacing.drain_timeout_ms);

    const auto& snd = section_of(j, "sender");
    read(snd, "replan_interval", s.sender.replan_interval);
    read(snd, "rtt_sample_interval", s.sender.rtt_sample_interval);
    read(snd, "yield_interval", s.sender.yield_interval);

    const auto& r = section_of(j, "receiver");
    read(r, "save_dir", s.receiver.save_dir);
    read(r, "streaming_threshold", s.receiver.streaming_threshold);
    read(r, "streaming_available", s.receiver.streaming_available);
    read(r, "verify_streamed_files", s.receiver.verify_streamed_files);
    read(r, "finalize_grace_ms", s.receiver.finalize_grace_ms);
    read(r, "pending_start_timeout_ms", s.receiver.pending_start_timeout_ms);
    read(r, "pending_max_age_ms", s.receiver.pending_max_age_ms);
    read(r, "stall_timeout_ms", s.receiver.stall_timeout_ms);
    read(r, "max_finalize_rounds", s.receiver.max_finalize_rounds);
    read(r, "max_chunk_retries", s.receiver.max_chunk_retries);

    const auto& ps = section_of(j, "persistence");
    read(ps, "enabled", s.persistence.enabled);
    read(ps, "directory", s.persistence.directory);
    read(ps, "database", s.persistence.database);
    read(ps, "prefer_transactional", s.persistence.prefer_transactional);
    read(ps, "max_state_age_ms", s.persistence.max_state_age_ms);
    read(ps, "max_resume_attempts", s.persistence.max_resume_attempts);
    read(ps, "save_throttle_ms", s.persistence.save_throttle_ms);
    read(ps, "max_state_size", s.persistence.max_state_size);
    read(ps, "max_stored_transfers", s.persistence.max_stored_transfers);
    read(ps, "max_primary_failures", s.persistence.max_primary_failures);
    read(ps, "primary_cooldown_ms", s.persistence.primary_cooldown_ms);
    read(ps, "recreation_cooldown_ms", s.persistence.recreation_cooldown_ms);
    read(ps, "cleanup_interval_ms", s.persistence.cleanup_interval_ms);

    const auto& a = section_of(j, "ack");
    read(a, "small_file_threshold", s.ack.small_file_threshold);
    read(a, "medium_file_threshold", s.ack.medium_file_threshold);
    read(a, "large_file_interval_ms", s.ack.large_file_interval_ms);
    read(a, "min_interval_ms", s.ack.min_interval_ms);

    read(section_of(j, "logging"), "level", s.logging.level);
    return s;
}

json TransferSettings::to_json() const {
    return {
        {"chunking",
         {{"adaptive", chunking.adaptive},
          {"min_chunk_size", chunking.min_chunk_size},
          {"max_chunk_size", chunking.max_chunk_size},
          {"default_chunk_size", chunking.default_chunk_size},
          {"adaptation_rate", chunking.adaptation_rate},
          {"stability_threshold_ms", chunking.stability_threshold_ms},
          {"quality_window", chunking.quality_window},
          {"target_rtt_ms", chunking.target_rtt_ms},
          {"target_buffer_utilization", chunking.target_buffer_utilization},
          {"bandwidth_utilization_target", chunking.bandwidth_utilization_target},
          {"buffer_capacity", chunking.buffer_capacity},
          {"oversize_reduction", chunking.oversize_reduction},
          {"min_change_ratio", chunking.min_change_ratio},
          {"min_confidence", chunking.min_confidence}}},
        {"pacing",
         {{"constrained_peer", pacing.constrained_peer},
          {"high_water_mark", pacing.high_water_mark},
          {"constrained_high_water_mark", pacing.constrained_high_water_mark},
          {"low_threshold", pacing.low_threshold},
          {"constrained_low_threshold", pacing.constrained_low_threshold},
          {"wait_timeout_ms", pacing.wait_timeout_ms},
          {"drain_poll_ms", pacing.drain_poll_ms},
          {"drain_timeout_ms", pacing.drain_timeout_ms}}},
        {"sender",
         {{"replan_interval", sender.replan_interval},
          {"rtt_sample_interval", sender.rtt_sample_interval},
          {"yield_interval", sender.yield_interval}}},
        {"receiver",
         {{"save_dir", receiver.save_dir},
          {"streaming_threshold", receiver.streaming_threshold},
          {"streaming_available", receiver.streaming_available},
          {"verify_streamed_files", receiver.verify_streamed_files},
          {"finalize_grace_ms", receiver.finalize_grace_ms},
          {"pending_start_timeout_ms", receiver.pending_start_timeout_ms},
          {"pending_max_age_ms", receiver.pending_max_age_ms},
          {"stall_timeout_ms", receiver.stall_timeout_ms},
          {"max_finalize_rounds", receiver.max_finalize_rounds},
          {"max_chunk_retries", receiver.max_chunk_retries}}},
        {"persistence",
         {{"enabled", persistence.enabled},
          {"directory", persistence.directory},
          {"database", persistence.database},
          {"prefer_transactional", persistence.prefer_transactional},
          {"max_state_age_ms", persistence.max_state_age_ms},
          {"max_resume_attempts", persistence.max_resume_attempts},
          {"save_throttle_ms", persistence.save_throttle_ms},
          {"max_state_size", persistence.max_state_size},
          {"max_stored_transfers", persistence.max_stored_transfers},
          {"max_primary_failures", persistence.max_primary_failures},
          {"primary_cooldown_ms", persistence.primary_cooldown_ms},
          {"recreation_cooldown_ms", persistence.recreation_cooldown_ms},
          {"cleanup_interval_ms", persistence.cleanup_interval_ms}}},
        {"ack",
         {{"small_file_threshold", ack.small_file_threshold},
          {"medium_file_threshold", ack.medium_file_threshold},
          {"large_file_interval_ms", ack.large_file_interval_ms},
          {"min_interval_ms", ack.min_interval_ms}}},
        {"logging", {{"level", logging.level}}},
    };
}

void Settings::init(const std::string& executable_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_path_.empty()) {
        spdlog::warn("[Settings::init] Settings already initialized, ignoring new initialization");
        return;
    }

    std::filesystem::path exe_dir;
    if (!executable_path.empty()) {
        exe_dir = std::filesystem::path(executable_path).parent_path();
    } else {
        exe_dir = std::filesystem::current_path();
    }

    file_path_ = (exe_dir / "settings.json").string();
    spdlog::info("[Settings::init] Settings file path: {}", file_path_);

    load();
}

TransferSettings Settings::transfer_settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return TransferSettings::from_json(settings_);
    } catch (const json::exception& e) {
        spdlog::error("[Settings::transfer_settings] Invalid settings, using defaults: {}", e.what());
        return TransferSettings{};
    }
}

void Settings::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_path_.empty()) {
        spdlog::error("[Settings::save] Settings not initialized, call init() first");
        return;
    }
    std::ofstream file(file_path_);
    if (!file.is_open()) {
        spdlog::error("[Settings::save] Failed to open config file for writing: {}", file_path_);
        return;
    }
    file << settings_.dump(4);
    spdlog::info("[Settings::save] Settings saved to {}", file_path_);
}

void Settings::create_default() {
    settings_ = TransferSettings{}.to_json();
    settings_["peer_name"] = "default_peer";
}

void Settings::load() {
    if (!std::filesystem::exists(file_path_)) {
        spdlog::warn("[Settings::load] Settings file not found, creating default: {}", file_path_);
        create_default();
        save_internal();
        return;
    }

    std::ifstream file(file_path_);
    if (!file.is_open()) {
        spdlog::error("[Settings::load] Failed to open settings file: {}", file_path_);
        create_default();
        return;
    }
    try {
        file >> settings_;
        spdlog::info("[Settings::load] Settings loaded from {}", file_path_);
    } catch (const json::parse_error& e) {
        spdlog::error("[Settings::load] Malformed settings file {}: {}", file_path_, e.what());
        create_default();
    }
}

void Settings::save_internal() {
    std::ofstream file(file_path_);
    if (!file.is_open()) {
        spdlog::error("[Settings::save_internal] Failed to create settings file: {}", file_path_);
        return;
    }
    file << settings_.dump(4);
    spdlog::info("[Settings::save_internal] Default settings created at {}", file_path_);
}

} // namespace util
