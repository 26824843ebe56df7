#include "engine/registry.hpp"

#include <algorithm>

namespace wf::engine {

BlockRegistry::BlockRegistry() : kinds_(KindRegistry::with_builtin_kinds()) {}

auto BlockRegistry::register_factory(std::string type, FactoryFn factory) -> void {
  factories_[std::move(type)] = std::move(factory);
}

auto BlockRegistry::register_instance(std::string type, BlockPtr block) -> void {
  register_factory(std::move(type), [block = std::move(block)](const Json&) -> Expected<BlockPtr> {
    return block;
  });
}

auto BlockRegistry::find(std::string_view type) const -> const FactoryFn* {
  auto it = factories_.find(std::string(type));
  if (it == factories_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto BlockRegistry::types() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto& [name, _] : factories_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace wf::engine
