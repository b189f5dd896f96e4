#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class ErrorKind {
  Config,
  OutsideSourceTree,
  NoPageFile,
  NoLayout,
  NoMenuPage,
  FrontMatterNotTerminated,
  FrontMatterParse,
  LinkCollision,
  LinkNotFound,
  DuplicatePermalink,
  TooManyRedirects,
  CyclicRedirect,
  RedirectFileExists,
  Template,
  Io,
  Hook,
  Build,
  Multi
};

const char *to_string(ErrorKind kind);

class KilnError : public std::runtime_error {
public:
  KilnError(ErrorKind kind, const std::string &message,
            const fs::path &path = fs::path())
      : std::runtime_error(message), kind_(kind), path_(path) {}

  ErrorKind kind() const { return kind_; }
  const fs::path &path() const { return path_; }

private:
  ErrorKind kind_;
  fs::path path_;
};

// Collected per-file failures from an aggregate (non fail-fast) build pass.
class MultiError : public KilnError {
public:
  explicit MultiError(std::vector<KilnError> errors)
      : KilnError(ErrorKind::Multi, summarize(errors)),
        errors_(std::move(errors)) {}

  const std::vector<KilnError> &errors() const { return errors_; }

private:
  static std::string summarize(const std::vector<KilnError> &errors) {
    std::string message = std::to_string(errors.size()) + " file(s) failed:";
    for (const auto &e : errors) {
      message += "\n  - ";
      message += e.what();
    }
    return message;
  }

  std::vector<KilnError> errors_;
};

inline const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Config:
    return "config";
  case ErrorKind::OutsideSourceTree:
    return "outside-source-tree";
  case ErrorKind::NoPageFile:
    return "no-page-file";
  case ErrorKind::NoLayout:
    return "no-layout";
  case ErrorKind::NoMenuPage:
    return "no-menu-page";
  case ErrorKind::FrontMatterNotTerminated:
    return "front-matter-not-terminated";
  case ErrorKind::FrontMatterParse:
    return "front-matter-parse";
  case ErrorKind::LinkCollision:
    return "link-collision";
  case ErrorKind::LinkNotFound:
    return "link-not-found";
  case ErrorKind::DuplicatePermalink:
    return "duplicate-permalink";
  case ErrorKind::TooManyRedirects:
    return "too-many-redirects";
  case ErrorKind::CyclicRedirect:
    return "cyclic-redirect";
  case ErrorKind::RedirectFileExists:
    return "redirect-file-exists";
  case ErrorKind::Template:
    return "template";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Hook:
    return "hook";
  case ErrorKind::Build:
    return "build";
  case ErrorKind::Multi:
    return "multi";
  }
  return "unknown";
}

#endif
