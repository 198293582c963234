#include "codec/ext_registry.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

namespace vc::codec {

auto ExtensionRegistry::add(const entt::type_info &type, std::uint8_t tag, ExtFn fn) -> Status {
  if (frozen()) {
    spdlog::warn("extension change rejected on frozen registry: type={}", type.name());
    return tl::unexpected(make_error(
        ErrorCode::Frozen,
        std::format("extension registry is frozen, cannot change type {}", type.name())));
  }
  std::erase_if(entries_, [&type](const ExtensionEntry &entry) { return entry.type == type; });
  if (fn) {
    if (entries_.size() + 1 > entries_.capacity()) {
      entries_.reserve((entries_.size() + 1) * 3 / 2 + 1);
    }
    entries_.push_back(ExtensionEntry{type, tag, std::move(fn)});
    spdlog::debug("extension registered: type={} tag={}", type.name(), static_cast<int>(tag));
  } else {
    spdlog::debug("extension removed: type={}", type.name());
  }
  rebuild_index();
  return {};
}

auto ExtensionRegistry::find(const entt::type_info &type) const -> const ExtensionEntry * {
  const auto count = entries_.size();
  if (count == 0) {
    return nullptr;
  }
  if (count < kLinearLookupThreshold) {
    for (const auto &entry : entries_) {
      if (entry.type == type) {
        return &entry;
      }
    }
    return nullptr;
  }
  auto it = index_.find(type);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

auto ExtensionRegistry::rebuild_index() -> void {
  index_.clear();
  index_.reserve(entries_.capacity());
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    index_.emplace(entries_[i].type, i);
  }
}

}  // namespace vc::codec
