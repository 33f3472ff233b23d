#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace agentstream {

class IdentityCanonicalizer {
public:
  struct Binding {
    std::string canonical_id;
    // Former root that was folded into `canonical_id`, if two sets were joined.
    std::optional<std::string> merged_id;
  };

  Binding bind_alias(const std::string& any_id, const std::string& canonical_id);

  std::string canonicalize(const std::string& id) const;

  [[nodiscard]] bool known(const std::string& id) const { return parent_.count(id) != 0; }
  [[nodiscard]] std::size_t size() const { return parent_.size(); }

private:
  const std::string& find_root(const std::string& id) const;
  void ensure(const std::string& id);

  mutable std::unordered_map<std::string, std::string> parent_;
};

}  // namespace agentstream
