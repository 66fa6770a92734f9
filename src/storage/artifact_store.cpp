#include "tts_queue/storage/artifact_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "tts_queue/logging.hpp"
#include "tts_queue/utils/time.hpp"

namespace tts_queue {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TimePoint to_system_time(fs::file_time_type file_time) {
    const auto now_file = fs::file_time_type::clock::now();
    const auto now_system = std::chrono::system_clock::now();
    return now_system + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                            file_time - now_file);
}

void write_file_atomic(const fs::path& target, const char* data, std::size_t size) {
    fs::path temp = target;
    temp += ArtifactStore::kTempExtension;
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw ArtifactError("cannot open " + temp.string() + " for writing");
        }
        out.write(data, static_cast<std::streamsize>(size));
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(temp, ec);
            throw ArtifactError("failed to write " + temp.string());
        }
    }
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        throw ArtifactError("failed to publish " + target.string() + ": " + ec.message());
    }
}

}

ArtifactStore::ArtifactStore(fs::path directory) : directory_(std::move(directory)) {}

std::size_t ArtifactStore::reload() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw ArtifactError("cannot create artifact directory " + directory_.string() + ": " +
                            ec.message());
    }

    std::unordered_map<JobId, ArtifactInfo> index;
    std::vector<fs::path> orphan_meta;
    for (const auto& entry : fs::directory_iterator(directory_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (ends_with(name, kTempExtension)) {
            std::error_code remove_ec;
            fs::remove(entry.path(), remove_ec);
            logging::warn(
                "Removed unfinished artifact write",
                {kv("file", name)});
            continue;
        }
        const auto stem = entry.path().stem().string();
        if (!is_valid_job_id(stem)) {
            continue;
        }
        if (ends_with(name, kAudioExtension)) {
            index[stem] = load_info(stem, entry.path());
        } else if (ends_with(name, kMetaExtension) && !fs::exists(artifact_path(stem))) {
            orphan_meta.push_back(entry.path());
        }
    }
    for (const auto& path : orphan_meta) {
        std::error_code remove_ec;
        fs::remove(path, remove_ec);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_ = std::move(index);
    logging::info(
        "Artifact index loaded",
        {kv("directory", directory_.string()),
         kv("artifacts", index_.size())});
    return index_.size();
}

ArtifactInfo ArtifactStore::load_info(const JobId& job_id, const fs::path& audio_path) const {
    ArtifactInfo info;
    info.job_id = job_id;
    std::error_code ec;
    const auto size = fs::file_size(audio_path, ec);
    info.size = ec ? 0 : size;
    const auto mtime = fs::last_write_time(audio_path, ec);
    info.created_at = ec ? std::chrono::system_clock::now() : to_system_time(mtime);
    info.completed_at = info.created_at;

    const auto meta = meta_path(job_id);
    if (!fs::exists(meta)) {
        return info;
    }
    try {
        std::ifstream in(meta);
        const auto json = nlohmann::json::parse(in);
        info.text = json.value("text", std::string());
        info.voice = json.value("voice", std::string());
        if (json.contains("created_at") && json["created_at"].is_number()) {
            info.created_at = utils::from_epoch_seconds(json["created_at"].get<double>());
        }
        if (json.contains("completed_at") && json["completed_at"].is_number()) {
            info.completed_at = utils::from_epoch_seconds(json["completed_at"].get<double>());
        }
    } catch (const std::exception& ex) {
        logging::warn(
            "Ignoring unreadable artifact metadata",
            {kv("job_id", job_id),
             kv("error", ex.what())});
    }
    return info;
}

void ArtifactStore::save(const JobId& job_id,
                         const TtsRequest& request,
                         TimePoint created_at,
                         const std::string& audio) {
    if (!is_valid_job_id(job_id)) {
        throw ArtifactError("invalid job id: " + job_id);
    }

    ArtifactInfo info;
    info.job_id = job_id;
    info.text = request.text;
    info.voice = request.voice;
    info.created_at = created_at;
    info.completed_at = std::chrono::system_clock::now();
    info.size = audio.size();

    const nlohmann::json meta{
        {"job_id", job_id},
        {"text", request.text},
        {"voice", request.voice},
        {"pitch", request.pitch},
        {"speed", request.speed},
        {"volume", request.volume},
        {"created_at", utils::to_epoch_seconds(info.created_at)},
        {"completed_at", utils::to_epoch_seconds(info.completed_at)},
        {"size", info.size},
    };
    const auto meta_text = meta.dump();

    // Metadata first: once the audio file appears its sidecar is already there.
    write_file_atomic(meta_path(job_id), meta_text.data(), meta_text.size());
    try {
        write_file_atomic(artifact_path(job_id), audio.data(), audio.size());
    } catch (const ArtifactError&) {
        std::error_code ec;
        fs::remove(meta_path(job_id), ec);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_[job_id] = std::move(info);
}

bool ArtifactStore::exists(const JobId& job_id) const {
    if (!is_valid_job_id(job_id)) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(artifact_path(job_id), ec);
}

FetchResult ArtifactStore::fetch(const JobId& job_id, std::size_t min_bytes) const {
    FetchResult result;
    if (!exists(job_id)) {
        result.outcome = FetchOutcome::NotFound;
        return result;
    }

    std::ifstream in(artifact_path(job_id), std::ios::binary);
    if (!in.is_open()) {
        // Deleted between the existence check and the open.
        if (!exists(job_id)) {
            result.outcome = FetchOutcome::NotFound;
            return result;
        }
        throw ArtifactError("cannot open artifact for job " + job_id);
    }
    result.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ArtifactError("failed to read artifact for job " + job_id);
    }
    if (result.data.empty() || result.data.size() < min_bytes) {
        result.outcome = FetchOutcome::Incomplete;
        result.data.clear();
        return result;
    }
    result.outcome = FetchOutcome::Ok;
    result.etag = etag_for(job_id);
    return result;
}

bool ArtifactStore::remove(const JobId& job_id) {
    if (!exists(job_id)) {
        return false;
    }
    std::error_code ec;
    const bool removed = fs::remove(artifact_path(job_id), ec);
    if (ec) {
        throw ArtifactError("failed to delete artifact for job " + job_id + ": " + ec.message());
    }
    std::error_code meta_ec;
    fs::remove(meta_path(job_id), meta_ec);
    if (meta_ec) {
        logging::warn(
            "Failed to delete artifact metadata",
            {kv("job_id", job_id),
             kv("error", meta_ec.message())});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_.erase(job_id);
    return removed;
}

std::size_t ArtifactStore::count() const {
    std::error_code ec;
    const auto state = fs::status(directory_, ec);
    if (!fs::exists(state)) {
        return 0;
    }
    if (!fs::is_directory(state)) {
        throw ArtifactError("audio path is not a directory: " + directory_.string());
    }
    std::size_t total = 0;
    for (const auto& entry : fs::directory_iterator(directory_)) {
        if (entry.is_regular_file() && entry.path().extension() == kAudioExtension) {
            ++total;
        }
    }
    return total;
}

std::vector<ArtifactInfo> ArtifactStore::list_completed() const {
    std::vector<ArtifactInfo> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(index_.size());
        for (const auto& item : index_) {
            snapshot.push_back(item.second);
        }
    }
    snapshot.erase(std::remove_if(snapshot.begin(), snapshot.end(),
                                  [this](const ArtifactInfo& info) {
                                      return !exists(info.job_id);
                                  }),
                   snapshot.end());
    return snapshot;
}

fs::path ArtifactStore::artifact_path(const JobId& job_id) const {
    return directory_ / (job_id + kAudioExtension);
}

fs::path ArtifactStore::meta_path(const JobId& job_id) const {
    return directory_ / (job_id + kMetaExtension);
}

bool ArtifactStore::is_valid_job_id(const std::string& job_id) {
    if (job_id.empty() || job_id.size() > 128) {
        return false;
    }
    return std::all_of(job_id.begin(), job_id.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '_';
    });
}

std::string ArtifactStore::etag_for(const JobId& job_id) {
    // FNV-1a, 64 bit.
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char ch : job_id) {
        hash ^= ch;
        hash *= 1099511628211ULL;
    }
    char buffer[19];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return std::string("\"") + buffer + "\"";
}

}
