#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Plain text pulled from a rendered page for the search index.
struct TextExtraction {
  std::optional<std::string> title;
  std::vector<std::string> chunks;
  std::size_t words = 0;
};

// Implementations are called from several workers at once.
class SyntaxHighlighter {
public:
  virtual ~SyntaxHighlighter() = default;

  // Highlighted markup for `code`, or nullopt when the language is unknown.
  virtual std::optional<std::string>
  highlight(const std::string &code, const std::string &language) const = 0;
};

// Maps fence info strings such as "js" or "sh" to canonical language names.
class LanguageAliases {
public:
  LanguageAliases();

  std::string resolve(const std::string &name) const;
  void add(const std::string &alias, const std::string &language);

private:
  std::map<std::string, std::string> aliases_;
};

class SearchIndexer {
public:
  virtual ~SearchIndexer() = default;

  virtual void add(const std::string &href, const TextExtraction &text) = 0;
  // Write the index for one collation output root.
  virtual void finish(const fs::path &target) = 0;
};

// Default indexer: a JSON array of {href, title, text, words}.
class JsonSearchIndexer : public SearchIndexer {
public:
  explicit JsonSearchIndexer(std::string file_name = "search.json")
      : file_name_(std::move(file_name)) {}

  void add(const std::string &href, const TextExtraction &text) override;
  void finish(const fs::path &target) override;

  std::size_t size() const;

private:
  struct Entry {
    std::string href;
    TextExtraction text;
  };

  std::string file_name_;
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

class BookCompiler {
public:
  virtual ~BookCompiler() = default;

  // Compile the book rooted at `book` and return the directory holding its
  // output. Draft sections are left out when `release` is set.
  virtual fs::path compile(const fs::path &book, bool release) = 0;
};

#endif
