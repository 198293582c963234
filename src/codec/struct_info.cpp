#include "codec/struct_info.hpp"

#include <format>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace vc::codec::detail {
namespace {

struct SchemaStore {
  std::mutex mutex;
  std::vector<std::shared_ptr<const StructInfo>> schemas;
};

auto schema_store() -> SchemaStore & {
  static SchemaStore store;
  return store;
}

}  // namespace

auto install_struct_info(std::shared_ptr<const StructInfo> info) -> Status {
  if (!info || !info->type) {
    return tl::unexpected(make_error(ErrorCode::InvalidConfig, "struct schema has no type"));
  }
  if (info->type->kind() != Kind::Struct) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidConfig,
        std::format("schema target is not a struct: {} ({})", info->type->name(),
                    kind_name(info->type->kind()))));
  }
  auto &store = schema_store();
  std::lock_guard<std::mutex> lock(store.mutex);
  // Replaced schemas stay alive; encoders may still hold pointers to them.
  store.schemas.push_back(info);
  info->type->set_struct_info(info.get());
  spdlog::debug("struct schema installed: type={} fields={}", info->type->name(),
                info->fields.size());
  return {};
}

auto flatten_embedded(std::size_t member, const StructInfo &embedded,
                      std::vector<FieldDescriptor> &out) -> void {
  for (const auto &inner : embedded.fields) {
    FieldDescriptor field;
    field.name = inner.name;
    field.omit_empty = inner.omit_empty;
    field.index = -1;
    field.path.push_back(member);
    if (inner.index >= 0) {
      field.path.push_back(static_cast<std::size_t>(inner.index));
    } else {
      field.path.insert(field.path.end(), inner.path.begin(), inner.path.end());
    }
    out.push_back(std::move(field));
  }
}

auto resolve_field_names(const Type &type, std::vector<FieldDescriptor> &fields) -> Status {
  auto depth = [](const FieldDescriptor &field) -> std::size_t {
    return field.index >= 0 ? 0 : field.path.size() - 1;
  };

  struct NameUse {
    std::size_t depth = 0;
    std::size_t count = 0;
  };
  std::unordered_map<std::string, NameUse> uses;
  for (const auto &field : fields) {
    auto [it, inserted] = uses.try_emplace(field.name, NameUse{depth(field), 1});
    if (inserted) {
      continue;
    }
    auto &use = it->second;
    if (depth(field) < use.depth) {
      use = NameUse{depth(field), 1};
    } else if (depth(field) == use.depth) {
      ++use.count;
    }
  }

  for (const auto &[name, use] : uses) {
    if (use.count > 1 && use.depth == 0) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidConfig,
          std::format("duplicate field name {} in struct {}", name, type.name())));
    }
  }

  std::vector<FieldDescriptor> kept;
  kept.reserve(fields.size());
  for (auto &field : fields) {
    const auto &use = uses.at(field.name);
    if (depth(field) != use.depth) {
      continue;
    }
    if (use.count > 1) {
      spdlog::debug("ambiguous embedded field dropped: type={} field={}", type.name(),
                    field.name);
      continue;
    }
    kept.push_back(std::move(field));
  }
  fields = std::move(kept);
  return {};
}

}  // namespace vc::codec::detail
