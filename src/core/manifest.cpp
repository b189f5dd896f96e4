#include "manifest.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>

Manifest::Manifest(fs::path file, bool incremental)
    : file_(std::move(file)), incremental_(incremental) {}

fs::path Manifest::file_for(const fs::path &target) {
  fs::path dir = target;
  if (!dir.has_filename()) {
    dir = dir.parent_path();
  }
  fs::path file = dir;
  file.replace_filename(dir.filename().string() + ".json");
  return file;
}

std::optional<std::int64_t> Manifest::modified_time(const fs::path &path) {
  std::error_code ec;
  auto time = fs::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             time.time_since_epoch())
      .count();
}

bool Manifest::is_dirty(const fs::path &source, const fs::path &destination,
                        bool force) const {
  if (!incremental_ || force || !fs::exists(destination)) {
    return true;
  }

  std::int64_t cached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(source.string());
    if (it == entries_.end()) {
      return true;
    }
    cached = it->second;
  }

  auto current = modified_time(source);
  return !current || *current > cached;
}

void Manifest::touch(const fs::path &source) {
  auto current = modified_time(source);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!current) {
    entries_.erase(source.string());
    return;
  }
  entries_[source.string()] = *current;
}

bool Manifest::contains(const fs::path &source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(source.string()) > 0;
}

std::size_t Manifest::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void Manifest::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  if (!fs::exists(file_)) {
    return;
  }

  std::ifstream stream(file_);
  nlohmann::json doc = nlohmann::json::parse(stream, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    Log::warn("Ignoring unreadable build manifest " + file_.string());
    return;
  }

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    const auto &entry = it.value();
    if (entry.is_object() && entry.contains("modified") &&
        entry["modified"].is_number_integer()) {
      entries_[it.key()] = entry["modified"].get<std::int64_t>();
    }
  }
}

void Manifest::save() const {
  if (!incremental_) {
    return;
  }

  nlohmann::json doc = nlohmann::json::object();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[path, modified] : entries_) {
      doc[path] = {{"modified", modified}};
    }
  }

  std::error_code ec;
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
  }
  if (ec) {
    Log::warn("Cannot create " + file_.parent_path().string() + ": " +
              ec.message());
    return;
  }
  std::ofstream stream(file_);
  if (!stream.is_open()) {
    Log::warn("Cannot write build manifest " + file_.string());
    return;
  }
  stream << doc.dump(2);
}
