#include "persistence/json_state_store.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace persistence {

JsonStateStore::JsonStateStore(std::filesystem::path directory, std::size_t max_record_size)
    : directory_(std::move(directory))
    , max_record_size_(max_record_size) {}

std::filesystem::path JsonStateStore::path_for(const std::string& key) const {
    return directory_ / (key + ".json");
}

bool JsonStateStore::put(const std::string& key, const TransferState& state) {
    const auto payload = to_json(state).dump();
    if (payload.size() > max_record_size_) {
        spdlog::warn("[JsonStateStore::put] Record {} is {} bytes, limit {}",
                     key,
                     payload.size(),
                     max_record_size_);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("[JsonStateStore::put] Failed to create {}: {}", directory_.string(), ec.message());
        return false;
    }

    const auto target = path_for(key);
    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            spdlog::error("[JsonStateStore::put] Cannot write {}", tmp.string());
            return false;
        }
        ofs << payload;
        if (!ofs.flush()) {
            spdlog::error("[JsonStateStore::put] Short write to {}", tmp.string());
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("[JsonStateStore::put] Failed to replace {}: {}", target.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<TransferState> JsonStateStore::read_file(const std::filesystem::path& path) const {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return std::nullopt;
    }
    const auto j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("[JsonStateStore::read_file] Corrupt record {}", path.string());
        return std::nullopt;
    }
    return state_from_json(j);
}

std::optional<TransferState> JsonStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_file(path_for(key));
}

bool JsonStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_for(key), ec);
    if (ec) {
        spdlog::error("[JsonStateStore::remove] {}: {}", key, ec.message());
        return false;
    }
    return true;
}

std::vector<TransferState> JsonStateStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferState> states;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return states;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        if (auto state = read_file(entry.path())) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

} // namespace persistence
