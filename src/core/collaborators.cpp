#include "collaborators.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

LanguageAliases::LanguageAliases()
    : aliases_({{"js", "javascript"},
                {"mjs", "javascript"},
                {"ts", "typescript"},
                {"sh", "bash"},
                {"shell", "bash"},
                {"zsh", "bash"},
                {"py", "python"},
                {"rs", "rust"},
                {"rb", "ruby"},
                {"c++", "cpp"},
                {"cc", "cpp"},
                {"cxx", "cpp"},
                {"hpp", "cpp"},
                {"h", "c"},
                {"yml", "yaml"},
                {"md", "markdown"},
                {"htm", "html"},
                {"xhtml", "html"}}) {}

std::string LanguageAliases::resolve(const std::string &name) const {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = aliases_.find(lower);
  return it == aliases_.end() ? lower : it->second;
}

void LanguageAliases::add(const std::string &alias,
                          const std::string &language) {
  aliases_[alias] = language;
}

void JsonSearchIndexer::add(const std::string &href,
                            const TextExtraction &text) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({href, text});
}

std::size_t JsonSearchIndexer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void JsonSearchIndexer::finish(const fs::path &target) {
  nlohmann::json doc = nlohmann::json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : entries_) {
      std::string body;
      for (const auto &chunk : entry.text.chunks) {
        if (!body.empty())
          body += " ";
        body += chunk;
      }
      doc.push_back({{"href", entry.href},
                     {"title", entry.text.title.value_or("")},
                     {"text", body},
                     {"words", entry.text.words}});
    }
    entries_.clear();
  }

  fs::path file = target / file_name_;
  fs::create_directories(file.parent_path());
  std::ofstream stream(file);
  if (!stream.is_open()) {
    throw KilnError(ErrorKind::Io, "Cannot write file: " + file.string(), file);
  }
  stream << doc.dump();
}
