#ifndef RESOURCE_HPP
#define RESOURCE_HPP

#include <filesystem>

namespace fs = std::filesystem;

enum class ResourceKind {
  Directory,
  File,
  Page,
  Asset,
  Locale,
  Partial,
  Include,
  DataSource
};

enum class ResourceOperation { Noop, Render, Copy, Link };

struct Resource {
  ResourceKind kind = ResourceKind::File;
  ResourceOperation operation = ResourceOperation::Copy;
  // Relative to the collation output root.
  fs::path destination;

  static Resource directory(const fs::path &destination) {
    return {ResourceKind::Directory, ResourceOperation::Noop, destination};
  }

  static Resource file(const fs::path &destination,
                       ResourceKind kind = ResourceKind::File,
                       ResourceOperation operation = ResourceOperation::Copy) {
    return {kind, operation, destination};
  }

  static Resource page(const fs::path &destination) {
    return {ResourceKind::Page, ResourceOperation::Render, destination};
  }
};

inline const char *to_string(ResourceKind kind) {
  switch (kind) {
  case ResourceKind::Directory:
    return "directory";
  case ResourceKind::File:
    return "file";
  case ResourceKind::Page:
    return "page";
  case ResourceKind::Asset:
    return "asset";
  case ResourceKind::Locale:
    return "locale";
  case ResourceKind::Partial:
    return "partial";
  case ResourceKind::Include:
    return "include";
  case ResourceKind::DataSource:
    return "data-source";
  }
  return "unknown";
}

#endif
