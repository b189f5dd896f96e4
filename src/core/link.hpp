#ifndef LINK_HPP
#define LINK_HPP

#include "collation.hpp"
#include "href.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Backs the `link` template helper.
class LinkResolver {
public:
  LinkResolver(const Collation &collation, const HrefResolver &resolver,
               const LinkConfig &config);

  // Site-absolute inputs become relative (or stay absolute when relative
  // links are off); external URLs and relative inputs pass through.
  // Throws LinkNotFound when verification is on and nothing serves `href`.
  std::string link(const std::string &href, const fs::path &current) const;

private:
  std::string strip_base_href(const std::string &path) const;

  const Collation &collation_;
  const HrefResolver &resolver_;
  const LinkConfig &config_;
};

#endif
