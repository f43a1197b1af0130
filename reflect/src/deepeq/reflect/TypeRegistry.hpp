#pragma once

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/diag/logging.hpp"
#include "deepeq/memory/container/hashmap.hpp"
#include "deepeq/memory/container/shared_ptr.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/reflect/Member.hpp"
#include "deepeq/reflect/Object.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"
#include "deepeq/reflect/traits.hpp"
#include <concepts>
#include <fmt/format.h>
#include <iterator>
#include <memory>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace deepeq::reflect {

template <typename T> class TypeBuilder;

namespace details {

// A type is reflected when an ADL-visible hook
//   void deepeq_reflect(deepeq::reflect::TypeBuilder<T> &);
// exists, typically declared next to T.
template <typename T>
concept reflectable = requires(TypeBuilder<T> &builder) {
  deepeq_reflect(builder);
};

} // namespace details

/// Process-wide registry of type descriptors keyed by std::type_index.
///
/// describe<T>() describes T on first use: through its deepeq_reflect hook
/// when one exists, otherwise from its traits (string-like, sequence,
/// equality comparable). Types that are only reachable through a base
/// pointer must be described before the traversal that meets them, so the
/// dynamic type can be found.
///
/// The registry is not synchronized.
class TypeRegistry {
public:
  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry &operator=(const TypeRegistry &) = delete;

  static TypeRegistry &global();

  template <typename T> const TypeDescriptor &describe();

  // explicit registration, for types without a deepeq_reflect hook.
  template <typename T> TypeBuilder<T> define(memory::string name);

  const TypeDescriptor *find(std::type_index id) const;

  std::size_t size() const { return m_types.size(); }

  static memory::string demangle(const char *name);

private:
  TypeRegistry() = default;

  TypeDescriptor &insert(std::type_index id, memory::string name,
                         TypeKind kind);
  // drops a descriptor whose hook failed half way.
  void erase(std::type_index id);

  memory::hash_map<std::type_index, memory::unique_ptr<TypeDescriptor>>
      m_types;
};

namespace details {

inline memory::shared_ptr<const void> unowned(const void *address) {
  // aliasing an empty owner: non-null, without a control block.
  return memory::shared_ptr<const void>(memory::shared_ptr<const void>(),
                                        address);
}

template <typename T>
Object make_object(const memory::shared_ptr<const void> &owner,
                   const T &value) {
  TypeRegistry &registry = TypeRegistry::global();
  const void *address = std::addressof(value);
  const void *origin = address;
  const TypeDescriptor *type = nullptr;
  if constexpr (std::is_polymorphic_v<T>) {
    origin = dynamic_cast<const void *>(std::addressof(value));
    if (std::type_index(typeid(value)) != std::type_index(typeid(T))) {
      type = registry.find(typeid(value));
      if (type != nullptr) {
        address = origin;
      } else {
        DEEPEQ_DEBUG("dynamic type {} of a {} is not described, using the "
                     "static type",
                     TypeRegistry::demangle(typeid(value).name()),
                     TypeRegistry::demangle(typeid(T).name()));
      }
    }
  }
  if (type == nullptr) {
    type = &registry.describe<T>();
  }
  if (owner == nullptr) {
    return Object(unowned(address), type, origin);
  }
  return Object(memory::shared_ptr<const void>(owner, address), type, origin);
}

} // namespace details

// Handle to a value that outlives the handle.
template <typename T> Object borrow(const T &value) {
  return details::make_object(nullptr, value);
}

// Handle that keeps its own copy of the value.
template <typename T> Object own(T &&value) {
  using U = std::remove_cvref_t<T>;
  auto owned = std::make_shared<const U>(std::forward<T>(value));
  return details::make_object(owned, *owned);
}

namespace details {

template <typename M> Object object_of(const M &value) {
  if constexpr (c_string<M>) {
    if (value == nullptr) {
      return Object{};
    }
    return borrow(value);
  } else if constexpr (is_pointer_like_v<M>) {
    if (!value) {
      return Object{};
    }
    return borrow(*value);
  } else {
    return borrow(value);
  }
}

// getter results are prvalues, owned handles keep them alive.
template <typename R> Object object_of_result(R value) {
  if constexpr (c_string<R>) {
    if (value == nullptr) {
      return Object{};
    }
    return own(value);
  } else if constexpr (std::is_pointer_v<R> && is_pointer_like_v<R>) {
    return object_of(value);
  } else if constexpr (is_shared_ptr_v<R>) {
    if (!value) {
      return Object{};
    }
    return make_object(value, *value);
  } else if constexpr (is_unique_ptr_v<R>) {
    if (!value) {
      return Object{};
    }
    memory::shared_ptr<const typename pointer_like<R>::element_type> shared(
        std::move(value));
    return make_object(shared, *shared);
  } else if constexpr (is_optional_v<R>) {
    if (!value) {
      return Object{};
    }
    return own(std::move(*value));
  } else {
    return own(std::move(value));
  }
}

template <typename Range, typename It> Object item_of(const It &it) {
  using Ref = std::ranges::range_reference_t<const Range>;
  if constexpr (std::is_lvalue_reference_v<Ref>) {
    return object_of(*it);
  } else {
    return object_of_result<std::remove_cvref_t<Ref>>(*it);
  }
}

} // namespace details

/// Describes the members of an object type.
///
///   void deepeq_reflect(deepeq::reflect::TypeBuilder<Person> &b) {
///     b.named("Person")
///         .member("Name", &Person::name)
///         .member("FullName", &Person::fullName);
///   }
template <typename T> class TypeBuilder {
public:
  explicit TypeBuilder(TypeDescriptor &descriptor)
      : m_descriptor(&descriptor) {}

  TypeBuilder &named(memory::string name) {
    m_descriptor->m_name = std::move(name);
    return *this;
  }

  template <typename C, typename M>
    requires std::is_base_of_v<C, T> && (!std::is_function_v<M>)
  TypeBuilder &member(memory::string name, M C::*field) {
    addMember(std::move(name), [field](const void *instance) -> Object {
      const T &self = *static_cast<const T *>(instance);
      return details::object_of(self.*field);
    });
    return *this;
  }

  // const getters, noexcept ones deduce through the function pointer
  // conversion.
  template <typename C, typename R>
    requires std::is_base_of_v<C, T>
  TypeBuilder &member(memory::string name, R (C::*getter)() const) {
    addMember(std::move(name), [getter](const void *instance) -> Object {
      const T &self = *static_cast<const T *>(instance);
      return invoke(self, getter);
    });
    return *this;
  }

  // Inherits the members of B, which is described first.
  template <typename B>
    requires std::is_base_of_v<B, T> && (!std::is_same_v<B, T>)
  TypeBuilder &base() {
    const TypeDescriptor &baseType = TypeRegistry::global().describe<B>();
    m_descriptor->m_bases.push_back(TypeDescriptor::Base{
        &baseType, [](const void *address) -> const void * {
          return static_cast<const B *>(static_cast<const T *>(address));
        }});
    for (const Member &inherited : baseType.members()) {
      if (m_descriptor->findMember(inherited.name()) != nullptr) {
        diag::invalid_argument(
            fmt::format("{} inherits member '{}' twice", m_descriptor->name(),
                        inherited.name()));
      }
      m_descriptor->m_members.push_back(inherited);
    }
    return *this;
  }

  const TypeDescriptor &descriptor() const { return *m_descriptor; }

private:
  template <typename Getter>
  static Object invoke(const T &self, Getter getter) {
    using R = decltype((self.*getter)());
    if constexpr (std::is_lvalue_reference_v<R>) {
      return details::object_of((self.*getter)());
    } else {
      return details::object_of_result<R>((self.*getter)());
    }
  }

  void addMember(memory::string name, Member::Reader reader) {
    if (m_descriptor->findMember(name) != nullptr) {
      diag::invalid_argument(fmt::format("{} already has a member named '{}'",
                                         m_descriptor->name(), name));
    }
    m_descriptor->m_members.emplace_back(std::move(name), m_descriptor,
                                         std::move(reader));
  }

  TypeDescriptor *m_descriptor;
};

template <typename T> const TypeDescriptor &TypeRegistry::describe() {
  using U = std::remove_cvref_t<T>;
  if (const TypeDescriptor *known = find(typeid(U)); known != nullptr) {
    return *known;
  }

  if constexpr (details::reflectable<U>) {
    // inserted before the hook runs so self-referencing members resolve.
    TypeBuilder<U> builder{
        insert(typeid(U), demangle(typeid(U).name()), TypeKind::Object)};
    try {
      deepeq_reflect(builder);
    } catch (...) {
      erase(typeid(U));
      throw;
    }
    DEEPEQ_DEBUG("described {} with {} member(s)", builder.descriptor().name(),
                 builder.descriptor().members().size());
    return builder.descriptor();
  } else if constexpr (details::string_like<U>) {
    TypeDescriptor &type =
        insert(typeid(U),
               std::is_same_v<U, std::string> ? memory::string("std::string")
                                              : demangle(typeid(U).name()),
               TypeKind::Value);
    type.m_equals = [](const void *lhs, const void *rhs) {
      return details::string_view_of(*static_cast<const U *>(lhs)) ==
             details::string_view_of(*static_cast<const U *>(rhs));
    };
    type.m_format = [](const void *value) -> memory::string {
      const auto view =
          details::string_view_of(*static_cast<const U *>(value));
      if (!view.has_value()) {
        return "<null>";
      }
      return fmt::format("\"{}\"", *view);
    };
    return type;
  } else if constexpr (details::sequence_like<U>) {
    TypeDescriptor &type =
        insert(typeid(U), demangle(typeid(U).name()), TypeKind::Sequence);
    type.m_size = [](const void *sequence) -> std::size_t {
      return static_cast<std::size_t>(
          std::ranges::size(*static_cast<const U *>(sequence)));
    };
    type.m_at = [](const void *sequence, std::size_t index) -> Object {
      const U &range = *static_cast<const U *>(sequence);
      return details::item_of<U>(std::ranges::next(
          std::ranges::begin(range),
          static_cast<std::ranges::range_difference_t<const U>>(index)));
    };
    type.m_items = [](const void *sequence) -> memory::vector<Object> {
      const U &range = *static_cast<const U *>(sequence);
      memory::vector<Object> items;
      items.reserve(static_cast<std::size_t>(std::ranges::size(range)));
      for (auto it = std::ranges::begin(range); it != std::ranges::end(range);
           ++it) {
        items.push_back(details::item_of<U>(it));
      }
      return items;
    };
    return type;
  } else if constexpr (std::equality_comparable<U>) {
    TypeDescriptor &type =
        insert(typeid(U), demangle(typeid(U).name()), TypeKind::Value);
    type.m_equals = [](const void *lhs, const void *rhs) -> bool {
      return *static_cast<const U *>(lhs) == *static_cast<const U *>(rhs);
    };
    type.m_format = [name = type.name()](const void *value) -> memory::string {
      const U &v = *static_cast<const U *>(value);
      if constexpr (std::is_enum_v<U>) {
        return fmt::format("{}::{}", name,
                           static_cast<std::underlying_type_t<U>>(v));
      } else if constexpr (fmt::is_formattable<U>::value) {
        return fmt::format("{}", v);
      } else {
        return name;
      }
    };
    return type;
  } else {
    DEEPEQ_WARN("{} has no deepeq_reflect hook and no equality, it is "
                "described without members",
                demangle(typeid(U).name()));
    return insert(typeid(U), demangle(typeid(U).name()), TypeKind::Object);
  }
}

template <typename T> TypeBuilder<T> TypeRegistry::define(memory::string name) {
  static_assert(std::is_same_v<T, std::remove_cvref_t<T>>,
                "define the unqualified type");
  if (find(typeid(T)) != nullptr) {
    diag::invalid_argument(
        fmt::format("type {} is already described", std::move(name)));
  }
  DEEPEQ_DEBUG("defining {}", name);
  return TypeBuilder<T>(insert(typeid(T), std::move(name), TypeKind::Object));
}

} // namespace deepeq::reflect
