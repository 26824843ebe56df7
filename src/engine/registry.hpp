#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/block.hpp"
#include "engine/error.hpp"
#include "engine/kinds.hpp"

namespace wf::engine {

/// Maps a step type identifier to a factory producing a Block. Populated at
/// startup; compilation only reads it.
class BlockRegistry {
 public:
  using FactoryFn = std::function<Expected<BlockPtr>(const Json& step)>;

  BlockRegistry();

  auto register_factory(std::string type, FactoryFn factory) -> void;

  /// Registers a default-constructible block type under one or more type names.
  template <typename B>
  auto register_block(std::initializer_list<std::string_view> types) -> void {
    for (auto type : types) {
      register_factory(std::string(type), [](const Json&) -> Expected<BlockPtr> {
        return std::make_shared<B>();
      });
    }
  }

  /// Registers one shared instance for every step of the given type.
  auto register_instance(std::string type, BlockPtr block) -> void;

  auto find(std::string_view type) const -> const FactoryFn*;
  auto types() const -> std::vector<std::string>;

  auto kinds() -> KindRegistry& { return kinds_; }
  auto kinds() const -> const KindRegistry& { return kinds_; }

 private:
  std::unordered_map<std::string, FactoryFn> factories_;
  KindRegistry kinds_;
};

}  // namespace wf::engine
