#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "engine/error.hpp"
#include "engine/kinds.hpp"
#include "engine/types.hpp"

namespace wf::engine {

struct FieldSchema {
  std::string name;
  /// Kinds a selector bound to this field may produce. Empty means literal only.
  KindSet kinds;
  bool required = true;
  Json default_value;
};

struct OutputSchema {
  std::string name;
  KindSet kinds;
};

struct BlockSchema {
  std::vector<FieldSchema> fields;

  auto find(std::string_view name) const -> const FieldSchema* {
    for (const auto& field : fields) {
      if (field.name == name) {
        return &field;
      }
    }
    return nullptr;
  }
};

/// Field name to resolved value. For batch-accepting blocks batch-shaped fields
/// hold one array element per batch item.
using BlockInputs = std::unordered_map<std::string, Json>;

/// Output name to produced value. Batch-accepting blocks return arrays aligned
/// with the batch.
using BlockOutputs = std::unordered_map<std::string, Json>;

/// Capability contract implemented by step types. `run` may be invoked
/// concurrently (per batch item and across runs sharing a compiled plan).
class Block {
 public:
  virtual ~Block() = default;

  virtual auto schema() const -> const BlockSchema& = 0;
  virtual auto declare_outputs() const -> std::vector<OutputSchema> = 0;
  virtual auto accepts_batch_input() const -> bool { return false; }
  virtual auto run(const BlockInputs& inputs, const RunContextView& ctx) -> Expected<BlockOutputs> = 0;
};

using BlockPtr = std::shared_ptr<Block>;

/// Convenience for block implementations reporting a failure.
inline auto block_error(std::string message) -> EngineError {
  return make_error(ErrorCode::StepExecution, std::move(message));
}

}  // namespace wf::engine
