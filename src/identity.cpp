#include "agentstream/identity.hpp"

#include <vector>

namespace agentstream {

void IdentityCanonicalizer::ensure(const std::string& id) {
  parent_.try_emplace(id, id);
}

const std::string& IdentityCanonicalizer::find_root(const std::string& id) const {
  auto it = parent_.find(id);
  std::vector<std::unordered_map<std::string, std::string>::iterator> path;
  while (it->second != it->first) {
    path.push_back(it);
    it = parent_.find(it->second);
  }
  for (auto& node : path) {
    node->second = it->first;
  }
  return it->first;
}

IdentityCanonicalizer::Binding IdentityCanonicalizer::bind_alias(const std::string& any_id,
                                                                 const std::string& canonical_id) {
  ensure(any_id);
  ensure(canonical_id);

  std::string from_root = find_root(any_id);
  std::string to_root = find_root(canonical_id);
  if (from_root == to_root) {
    return Binding{to_root, std::nullopt};
  }

  parent_[from_root] = to_root;
  parent_[any_id] = to_root;
  return Binding{to_root, from_root};
}

std::string IdentityCanonicalizer::canonicalize(const std::string& id) const {
  if (parent_.count(id) == 0) {
    return id;
  }
  return find_root(id);
}

}  // namespace agentstream
