#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/core/type_info.hpp>

#include "codec/error.hpp"
#include "codec/value.hpp"

namespace vc::codec {

using Bytes = std::vector<std::uint8_t>;

/// Result of an extension function: a payload, or std::nullopt to encode nil.
using ExtResult = Expected<std::optional<Bytes>>;
using ExtFn = std::function<ExtResult(const Value &)>;

struct ExtensionEntry {
  entt::type_info type;
  std::uint8_t tag = 0;
  ExtFn fn;
};

/// Type -> (tag, encode function) table.
///
/// Entries live in a vector scanned linearly while the table is small, and are
/// indexed by a hash map once it reaches kLinearLookupThreshold entries. Both
/// views are rebuilt together on every mutation. Mutation is only allowed
/// before freeze().
class ExtensionRegistry {
public:
  static constexpr std::size_t kLinearLookupThreshold = 5;

  ExtensionRegistry() = default;
  ExtensionRegistry(const ExtensionRegistry &) = delete;
  auto operator=(const ExtensionRegistry &) -> ExtensionRegistry & = delete;

  /// Register fn for type under tag. An empty fn removes the entry.
  auto add(const entt::type_info &type, std::uint8_t tag, ExtFn fn) -> Status;

  /// Register a function taking the concrete type.
  template <typename T, typename Fn> auto add(std::uint8_t tag, Fn fn) -> Status {
    return add(entt::type_id<T>(), tag, [fn = std::move(fn)](const Value &value) -> ExtResult {
      const auto *typed = value.as<T>();
      if (!typed) {
        return tl::unexpected(make_error(ErrorCode::Extension, "extension value type mismatch"));
      }
      return fn(*typed);
    });
  }

  auto remove(const entt::type_info &type) -> Status { return add(type, 0, nullptr); }

  auto find(const entt::type_info &type) const -> const ExtensionEntry *;

  auto size() const -> std::size_t { return entries_.size(); }
  auto empty() const -> bool { return entries_.empty(); }

  auto freeze() -> void { frozen_.store(true, std::memory_order_release); }
  auto frozen() const -> bool { return frozen_.load(std::memory_order_acquire); }

private:
  struct TypeInfoHash {
    auto operator()(const entt::type_info &info) const -> std::size_t {
      return static_cast<std::size_t>(info.hash());
    }
  };

  auto rebuild_index() -> void;

  std::vector<ExtensionEntry> entries_;
  std::unordered_map<entt::type_info, std::size_t, TypeInfoHash> index_;
  std::atomic<bool> frozen_{false};
};

}  // namespace vc::codec
