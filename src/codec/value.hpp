#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include <entt/core/type_info.hpp>
#include <nlohmann/json.hpp>

#include "codec/error.hpp"

namespace vc::codec {

using Json = nlohmann::json;

/// Runtime shape of an encodable value.
enum class Kind : std::uint8_t {
  Invalid,
  Bool,
  Int8,
  Int16,
  Int32,
  Int64,
  Uint8,
  Uint16,
  Uint32,
  Uint64,
  Float32,
  Float64,
  String,
  Slice,
  Array,
  Map,
  Struct,
  Pointer,
  Interface,
  Unsupported,
};

auto kind_name(Kind kind) -> std::string_view;
auto is_int_kind(Kind kind) -> bool;
auto is_uint_kind(Kind kind) -> bool;

class Value;
struct StructInfo;

using EntryVisitor = std::function<Status(const Value &key, const Value &value)>;

/// Shape descriptor for one C++ type. One instance per type, created on first
/// use by type_of<T>() and alive for the rest of the process.
///
/// The per-kind accessors are only meaningful for the matching kind; the
/// engine never calls an accessor that does not belong to the value's kind.
class Type {
public:
  Type(Kind kind, const entt::type_info &info, const Type *elem = nullptr,
       const Type *key = nullptr)
      : kind_(kind), info_(info), elem_(elem), key_(key) {}
  Type(const Type &) = delete;
  auto operator=(const Type &) -> Type & = delete;
  virtual ~Type() = default;

  auto kind() const -> Kind { return kind_; }
  auto info() const -> const entt::type_info & { return info_; }
  auto name() const -> std::string_view { return info_.name(); }
  /// Element type of a slice, array or pointer, value type of a map.
  auto elem() const -> const Type * { return elem_; }
  /// Key type of a map.
  auto key() const -> const Type * { return key_; }
  /// Slice or fixed array of std::uint8_t; encoded as one raw byte string.
  auto is_byte_slice() const -> bool;

  /// Field metadata of a struct type; null until a schema is installed.
  auto struct_info() const -> const StructInfo * {
    return struct_info_.load(std::memory_order_acquire);
  }
  auto set_struct_info(const StructInfo *info) const -> void {
    struct_info_.store(info, std::memory_order_release);
  }

  virtual auto is_nil(const void *data) const -> bool;
  virtual auto length(const void *data) const -> std::size_t;
  virtual auto index(const void *data, std::size_t i) const -> Value;
  virtual auto elem_value(const void *data) const -> Value;
  virtual auto for_each_entry(const void *data, const EntryVisitor &visit) const
      -> Status;
  virtual auto bool_value(const void *data) const -> bool;
  virtual auto int_value(const void *data) const -> std::int64_t;
  virtual auto uint_value(const void *data) const -> std::uint64_t;
  virtual auto float_value(const void *data) const -> double;
  virtual auto string_value(const void *data) const -> std::string_view;
  virtual auto bytes_value(const void *data) const -> std::span<const std::uint8_t>;

private:
  Kind kind_;
  entt::type_info info_;
  const Type *elem_;
  const Type *key_;
  mutable std::atomic<const StructInfo *> struct_info_{nullptr};
};

template <typename T> auto type_of() -> const Type &;

/// Borrowed view of a typed datum. Never owns or mutates what it points at.
class Value {
public:
  Value() = default;
  Value(const Type *type, const void *data) : type_(type), data_(data) {}

  template <typename T> static auto of(const T &value) -> Value {
    return Value(&type_of<std::remove_cvref_t<T>>(),
                 static_cast<const void *>(std::addressof(value)));
  }

  auto valid() const -> bool { return type_ != nullptr; }
  auto type() const -> const Type * { return type_; }
  auto data() const -> const void * { return data_; }
  auto kind() const -> Kind { return type_ ? type_->kind() : Kind::Invalid; }

  auto is_nil() const -> bool { return type_ && type_->is_nil(data_); }
  auto len() const -> std::size_t { return type_ ? type_->length(data_) : 0; }
  auto index(std::size_t i) const -> Value { return type_->index(data_, i); }
  auto elem() const -> Value { return type_->elem_value(data_); }
  auto field(std::size_t i) const -> Value;
  auto field_by_path(std::span<const std::size_t> path) const -> Value;
  auto for_each_entry(const EntryVisitor &visit) const -> Status {
    return type_->for_each_entry(data_, visit);
  }

  auto bool_value() const -> bool { return type_->bool_value(data_); }
  auto int_value() const -> std::int64_t { return type_->int_value(data_); }
  auto uint_value() const -> std::uint64_t { return type_->uint_value(data_); }
  auto float_value() const -> double { return type_->float_value(data_); }
  auto string_value() const -> std::string_view { return type_->string_value(data_); }
  auto bytes_value() const -> std::span<const std::uint8_t> {
    return type_->bytes_value(data_);
  }

  /// Typed access; null when the value does not hold exactly T.
  template <typename T> auto as() const -> const T * {
    if (!type_ || type_->info() != entt::type_id<T>()) {
      return nullptr;
    }
    return static_cast<const T *>(data_);
  }

private:
  const Type *type_ = nullptr;
  const void *data_ = nullptr;
};

/// false, numeric zero, nil pointer/interface/slice, or a zero-length
/// array, slice, map or string.
auto is_empty(const Value &value) -> bool;

namespace detail {

template <typename T> struct is_vector : std::false_type {};
template <typename E, typename A>
struct is_vector<std::vector<E, A>> : std::true_type {};

template <typename T> struct is_span : std::false_type {};
template <typename E, std::size_t N>
struct is_span<std::span<E, N>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename E, std::size_t N>
struct is_std_array<std::array<E, N>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_smart_pointer : std::false_type {};
template <typename E, typename D>
struct is_smart_pointer<std::unique_ptr<E, D>>
    : std::bool_constant<!std::is_array_v<E>> {};
template <typename E>
struct is_smart_pointer<std::shared_ptr<E>> : std::bool_constant<!std::is_array_v<E>> {};
template <typename E> struct is_smart_pointer<std::optional<E>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T>
inline constexpr bool is_char_array_v =
    std::is_bounded_array_v<T> && std::is_same_v<std::remove_cv_t<std::remove_extent_t<T>>, char>;

template <typename T>
inline constexpr bool is_c_string_v =
    std::is_same_v<T, const char *> || std::is_same_v<T, char *>;

template <typename T>
inline constexpr bool is_object_pointer_v =
    std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>;

template <typename T> struct pointee {
  using type = std::remove_cv_t<std::remove_pointer_t<T>>;
};
template <typename E, typename D> struct pointee<std::unique_ptr<E, D>> {
  using type = std::remove_cv_t<E>;
};
template <typename E> struct pointee<std::shared_ptr<E>> {
  using type = std::remove_cv_t<E>;
};
template <typename E> struct pointee<std::optional<E>> {
  using type = std::remove_cv_t<E>;
};

template <typename T> auto load(const void *data) -> const T & {
  return *static_cast<const T *>(data);
}

template <typename T> constexpr auto integer_kind() -> Kind {
  using U = typename std::conditional_t<std::is_enum_v<T>, std::underlying_type<T>,
                                        std::type_identity<T>>::type;
  if constexpr (std::is_signed_v<U>) {
    if constexpr (sizeof(U) == 1) return Kind::Int8;
    else if constexpr (sizeof(U) == 2) return Kind::Int16;
    else if constexpr (sizeof(U) == 4) return Kind::Int32;
    else return Kind::Int64;
  } else {
    if constexpr (sizeof(U) == 1) return Kind::Uint8;
    else if constexpr (sizeof(U) == 2) return Kind::Uint16;
    else if constexpr (sizeof(U) == 4) return Kind::Uint32;
    else return Kind::Uint64;
  }
}

template <typename T> class LeafType final : public Type {
public:
  explicit LeafType(Kind kind) : Type(kind, entt::type_id<T>()) {}
};

class BoolType final : public Type {
public:
  BoolType() : Type(Kind::Bool, entt::type_id<bool>()) {}
  auto bool_value(const void *data) const -> bool override { return load<bool>(data); }
};

/// Integers of every width and enums over them.
template <typename T> class IntegerType final : public Type {
  using Underlying = typename std::conditional_t<std::is_enum_v<T>, std::underlying_type<T>,
                                                 std::type_identity<T>>::type;

public:
  IntegerType() : Type(integer_kind<T>(), entt::type_id<T>()) {}

  auto int_value(const void *data) const -> std::int64_t override {
    return static_cast<std::int64_t>(static_cast<Underlying>(load<T>(data)));
  }
  auto uint_value(const void *data) const -> std::uint64_t override {
    return static_cast<std::uint64_t>(static_cast<Underlying>(load<T>(data)));
  }
};

template <typename T> class FloatType final : public Type {
public:
  FloatType()
      : Type(std::is_same_v<T, float> ? Kind::Float32 : Kind::Float64, entt::type_id<T>()) {}
  auto float_value(const void *data) const -> double override {
    return static_cast<double>(load<T>(data));
  }
};

template <typename T> class StringType final : public Type {
public:
  StringType() : Type(Kind::String, entt::type_id<T>()) {}

  auto length(const void *data) const -> std::size_t override { return view(data).size(); }
  auto string_value(const void *data) const -> std::string_view override { return view(data); }

private:
  static auto view(const void *data) -> std::string_view {
    const auto &value = load<T>(data);
    if constexpr (is_c_string_v<T>) {
      return value ? std::string_view(value) : std::string_view{};
    } else if constexpr (is_char_array_v<T>) {
      const auto *end = std::find(value, value + std::extent_v<T>, '\0');
      return std::string_view(value, static_cast<std::size_t>(end - value));
    } else {
      return std::string_view(value);
    }
  }
};

/// std::vector and std::span. Neither is ever nil; a nil sequence is spelled
/// as a null pointer or an empty std::optional around it.
template <typename C> class SliceType final : public Type {
  using Elem = std::remove_cv_t<typename C::value_type>;

public:
  SliceType() : Type(Kind::Slice, entt::type_id<C>(), &type_of<Elem>()) {}

  auto length(const void *data) const -> std::size_t override { return load<C>(data).size(); }
  auto index(const void *data, std::size_t i) const -> Value override {
    return Value::of(load<C>(data)[i]);
  }
  auto bytes_value(const void *data) const -> std::span<const std::uint8_t> override {
    if constexpr (std::is_same_v<Elem, std::uint8_t>) {
      const auto &slice = load<C>(data);
      return std::span<const std::uint8_t>(slice.data(), slice.size());
    } else {
      return {};
    }
  }
};

/// std::array and built-in arrays.
template <typename C> class ArrayType final : public Type {
  using Elem = std::remove_cv_t<std::remove_reference_t<decltype(std::declval<const C &>()[0])>>;

public:
  ArrayType() : Type(Kind::Array, entt::type_id<C>(), &type_of<Elem>()) {}

  auto length(const void *data) const -> std::size_t override {
    return std::size(load<C>(data));
  }
  auto index(const void *data, std::size_t i) const -> Value override {
    return Value::of(load<C>(data)[i]);
  }
  auto bytes_value(const void *data) const -> std::span<const std::uint8_t> override {
    if constexpr (std::is_same_v<Elem, std::uint8_t>) {
      const auto &array = load<C>(data);
      return std::span<const std::uint8_t>(std::data(array), std::size(array));
    } else {
      return {};
    }
  }
};

/// std::map and std::unordered_map; entries visit in the container's order.
template <typename M> class MapType final : public Type {
public:
  MapType()
      : Type(Kind::Map, entt::type_id<M>(), &type_of<typename M::mapped_type>(),
             &type_of<typename M::key_type>()) {}

  auto length(const void *data) const -> std::size_t override { return load<M>(data).size(); }
  auto for_each_entry(const void *data, const EntryVisitor &visit) const -> Status override {
    for (const auto &[key, value] : load<M>(data)) {
      if (auto status = visit(Value::of(key), Value::of(value)); !status) {
        return status;
      }
    }
    return {};
  }
};

/// Raw pointers, std::unique_ptr, std::shared_ptr and std::optional.
template <typename P> class PointerType final : public Type {
  using Elem = typename pointee<P>::type;

public:
  PointerType() : Type(Kind::Pointer, entt::type_id<P>(), &type_of<Elem>()) {}

  auto is_nil(const void *data) const -> bool override {
    return !static_cast<bool>(load<P>(data));
  }
  auto elem_value(const void *data) const -> Value override { return Value::of(*load<P>(data)); }
};

/// std::variant; nil when holding std::monostate or valueless.
template <typename V> class VariantType final : public Type {
public:
  VariantType() : Type(Kind::Interface, entt::type_id<V>()) {}

  auto is_nil(const void *data) const -> bool override {
    const auto &variant = load<V>(data);
    if (variant.valueless_by_exception()) {
      return true;
    }
    return std::visit(
        [](const auto &held) {
          return std::is_same_v<std::remove_cvref_t<decltype(held)>, std::monostate>;
        },
        variant);
  }
  auto elem_value(const void *data) const -> Value override {
    return std::visit([](const auto &held) { return Value::of(held); }, load<V>(data));
  }
};

/// nlohmann::json documents behave as an interface over their current value.
class JsonType final : public Type {
public:
  JsonType() : Type(Kind::Interface, entt::type_id<Json>()) {}

  auto is_nil(const void *data) const -> bool override;
  auto elem_value(const void *data) const -> Value override;
};

template <typename T> class StructType final : public Type {
public:
  StructType() : Type(Kind::Struct, entt::type_id<T>()) {}
};

template <typename T> auto make_type() -> std::unique_ptr<const Type> {
  if constexpr (std::is_same_v<T, bool>) {
    return std::make_unique<BoolType>();
  } else if constexpr (std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, std::monostate>) {
    return std::make_unique<LeafType<T>>(Kind::Invalid);
  } else if constexpr (is_c_string_v<T> || is_char_array_v<T> ||
                       std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>) {
    return std::make_unique<StringType<T>>();
  } else if constexpr ((std::is_integral_v<T> || std::is_enum_v<T>) && sizeof(T) <= 8) {
    return std::make_unique<IntegerType<T>>();
  } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
    return std::make_unique<FloatType<T>>();
  } else if constexpr (std::is_same_v<T, Json>) {
    return std::make_unique<JsonType>();
  } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
    return std::make_unique<LeafType<T>>(Kind::Unsupported);
  } else if constexpr (is_vector<T>::value || is_span<T>::value) {
    return std::make_unique<SliceType<T>>();
  } else if constexpr (is_std_array<T>::value || std::is_bounded_array_v<T>) {
    return std::make_unique<ArrayType<T>>();
  } else if constexpr (is_map<T>::value) {
    return std::make_unique<MapType<T>>();
  } else if constexpr (is_object_pointer_v<T> || is_smart_pointer<T>::value) {
    return std::make_unique<PointerType<T>>();
  } else if constexpr (is_variant<T>::value) {
    return std::make_unique<VariantType<T>>();
  } else if constexpr (std::is_class_v<T>) {
    return std::make_unique<StructType<T>>();
  } else {
    return std::make_unique<LeafType<T>>(Kind::Unsupported);
  }
}

}  // namespace detail

template <typename T> auto type_of() -> const Type & {
  static_assert(std::is_same_v<T, std::remove_cvref_t<T>>, "type_of expects an unqualified type");
  static const auto type = detail::make_type<T>();
  return *type;
}

}  // namespace vc::codec
