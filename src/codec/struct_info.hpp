#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "codec/error.hpp"
#include "codec/value.hpp"

namespace vc::codec {

/// One encodable struct field, in output order.
struct FieldDescriptor {
  /// Key written to the stream.
  std::string name;
  bool omit_empty = false;
  /// Member position for direct fields, -1 for fields reached through an
  /// embedded struct.
  int index = -1;
  /// Member positions from the outer struct down to the field; empty for
  /// direct fields.
  std::vector<std::size_t> path;
};

/// Physical member of a registered struct.
struct MemberAccessor {
  std::string name;
  const Type *type = nullptr;
  std::function<Value(const void *)> get;
};

struct StructInfo {
  const Type *type = nullptr;
  std::vector<MemberAccessor> members;
  std::vector<FieldDescriptor> fields;
};

struct FieldOptions {
  bool omit_empty = false;
};

struct StructOptions {
  /// Applies omit-empty to every field of the struct.
  bool omit_empty = false;
};

namespace detail {

/// Keeps installed schemas alive and publishes them on their Type.
auto install_struct_info(std::shared_ptr<const StructInfo> info) -> Status;

auto flatten_embedded(std::size_t member, const StructInfo &embedded,
                      std::vector<FieldDescriptor> &out) -> void;

/// Resolves key clashes: the shallowest field with a key wins, and a key held
/// by several fields at that depth is dropped. Duplicate direct keys fail.
auto resolve_field_names(const Type &type, std::vector<FieldDescriptor> &fields) -> Status;

}  // namespace detail

/// Explicit schema registration for a struct type.
///
///   register_struct<Point>()
///       .field("x", &Point::x)
///       .field("label", &Point::label, {.omit_empty = true})
///       .install();
template <typename T> class StructBuilder {
public:
  explicit StructBuilder(StructOptions options = {}) : options_(options) {
    info_->type = &type_of<T>();
  }

  template <typename M>
  auto field(std::string name, M T::*member, FieldOptions options = {}) -> StructBuilder & {
    auto position = add_member<M>(name, member);
    FieldDescriptor field;
    field.name = std::move(name);
    field.omit_empty = options.omit_empty || options_.omit_empty;
    field.index = static_cast<int>(position);
    info_->fields.push_back(std::move(field));
    return *this;
  }

  /// Inline the fields of an already registered struct member.
  template <typename M> auto embed(M T::*member) -> StructBuilder & {
    static_assert(std::is_class_v<M>, "only struct members can be embedded");
    const auto *embedded = type_of<M>().struct_info();
    auto position = add_member<M>(std::string(type_of<M>().name()), member);
    if (!embedded) {
      if (!error_) {
        error_ = make_error(ErrorCode::InvalidConfig,
                            "embedded struct has no schema: " + std::string(type_of<M>().name()));
      }
      return *this;
    }
    auto first = info_->fields.size();
    detail::flatten_embedded(position, *embedded, info_->fields);
    if (options_.omit_empty) {
      for (auto i = first; i < info_->fields.size(); ++i) {
        info_->fields[i].omit_empty = true;
      }
    }
    return *this;
  }

  auto install() -> Status {
    if (error_) {
      return tl::unexpected(*error_);
    }
    if (auto status = detail::resolve_field_names(*info_->type, info_->fields); !status) {
      return status;
    }
    return detail::install_struct_info(std::move(info_));
  }

private:
  template <typename M> auto add_member(const std::string &name, M T::*member) -> std::size_t {
    MemberAccessor accessor;
    accessor.name = name;
    accessor.type = &type_of<M>();
    accessor.get = [member](const void *object) -> Value {
      return Value::of(static_cast<const T *>(object)->*member);
    };
    info_->members.push_back(std::move(accessor));
    return info_->members.size() - 1;
  }

  StructOptions options_;
  std::shared_ptr<StructInfo> info_ = std::make_shared<StructInfo>();
  std::optional<EncodeError> error_;
};

template <typename T> auto register_struct(StructOptions options = {}) -> StructBuilder<T> {
  return StructBuilder<T>(options);
}

}  // namespace vc::codec
