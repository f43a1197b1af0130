#pragma once

#include "deepeq/memory/container/span.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/string_view.hpp"
#include "deepeq/memory/container/vector.hpp"
#include "deepeq/reflect/Member.hpp"
#include "deepeq/reflect/Object.hpp"
#include <cstddef>
#include <fmt/core.h>
#include <functional>
#include <typeindex>

namespace deepeq::reflect {

enum class TypeKind {
  Value,
  Object,
  Sequence,
};

template <typename T> class TypeBuilder;
class TypeRegistry;

class TypeDescriptor {
public:
  using Equals = std::function<bool(const void *, const void *)>;
  using Format = std::function<memory::string(const void *)>;
  using Size = std::function<std::size_t(const void *)>;
  using At = std::function<Object(const void *, std::size_t)>;
  using Items = std::function<memory::vector<Object>(const void *)>;
  using Upcast = const void *(*)(const void *);

  TypeDescriptor(std::type_index id, memory::string name, TypeKind kind);

  // members hold a pointer to their owner.
  TypeDescriptor(const TypeDescriptor &) = delete;
  TypeDescriptor &operator=(const TypeDescriptor &) = delete;
  TypeDescriptor(TypeDescriptor &&) = delete;
  TypeDescriptor &operator=(TypeDescriptor &&) = delete;

  std::type_index id() const { return m_id; }
  const memory::string &name() const { return m_name; }
  TypeKind kind() const { return m_kind; }

  bool isValue() const { return m_kind == TypeKind::Value; }
  bool isObject() const { return m_kind == TypeKind::Object; }
  bool isSequence() const { return m_kind == TypeKind::Sequence; }

  // declared order, inherited members first.
  memory::span<const Member> members() const { return m_members; }
  const Member *findMember(memory::string_view name) const;

  bool isAssignableTo(const TypeDescriptor &other) const;

  // Converts a pointer to an instance of this type into a pointer to its
  // `target` subobject. Returns nullptr if target is not a registered base.
  const void *upcast(const void *address, const TypeDescriptor &target) const;

  bool equals(const void *lhs, const void *rhs) const;
  memory::string format(const void *value) const;

  std::size_t size(const void *sequence) const;
  Object at(const void *sequence, std::size_t index) const;
  // every item in order, in a single pass over the sequence.
  memory::vector<Object> items(const void *sequence) const;

private:
  template <typename T> friend class TypeBuilder;
  friend class TypeRegistry;

  struct Base {
    const TypeDescriptor *type;
    Upcast upcast;
  };

  std::type_index m_id;
  memory::string m_name;
  TypeKind m_kind;
  memory::vector<Member> m_members;
  memory::vector<Base> m_bases;

  Equals m_equals;
  Format m_format;
  Size m_size;
  At m_at;
  Items m_items;
};

} // namespace deepeq::reflect

template <> struct fmt::formatter<deepeq::reflect::TypeKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(deepeq::reflect::TypeKind kind, FormatContext &ctx) const {
    switch (kind) {
    case deepeq::reflect::TypeKind::Value:
      return fmt::format_to(ctx.out(), "value");
    case deepeq::reflect::TypeKind::Object:
      return fmt::format_to(ctx.out(), "object");
    case deepeq::reflect::TypeKind::Sequence:
      return fmt::format_to(ctx.out(), "sequence");
    }
    return ctx.out();
  }
};
