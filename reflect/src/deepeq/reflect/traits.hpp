#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <type_traits>

namespace deepeq::reflect::details {

template <typename T>
concept string_like = std::is_convertible_v<const T &, std::string_view>;

// char* and const char*: string-like values, absent when null.
template <typename T>
concept c_string =
    std::is_pointer_v<T> &&
    std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>;

template <string_like T>
std::optional<std::string_view> string_view_of(const T &value) {
  if constexpr (c_string<T>) {
    if (value == nullptr) {
      return std::nullopt;
    }
  }
  return std::string_view(value);
}

template <typename T>
concept sequence_like = !string_like<T> && std::ranges::forward_range<const T> &&
                        std::ranges::sized_range<const T>;

// T*, shared_ptr<T>, unique_ptr<T> and optional<T> are read as their
// pointee, absent when empty.
template <typename T> struct pointer_like : std::false_type {};

template <typename T> struct pointer_like<T *> : std::true_type {
  using element_type = std::remove_cv_t<T>;
};

template <typename T> struct pointer_like<std::shared_ptr<T>> : std::true_type {
  using element_type = std::remove_cv_t<T>;
};

template <typename T, typename D>
struct pointer_like<std::unique_ptr<T, D>> : std::true_type {
  using element_type = std::remove_cv_t<T>;
};

template <typename T> struct pointer_like<std::optional<T>> : std::true_type {
  using element_type = std::remove_cv_t<T>;
};

template <typename T> inline constexpr bool is_shared_ptr_v = false;
template <typename T>
inline constexpr bool is_shared_ptr_v<std::shared_ptr<T>> = true;

template <typename T> inline constexpr bool is_unique_ptr_v = false;
template <typename T, typename D>
inline constexpr bool is_unique_ptr_v<std::unique_ptr<T, D>> = true;

template <typename T> inline constexpr bool is_optional_v = false;
template <typename T>
inline constexpr bool is_optional_v<std::optional<T>> = true;

template <typename T>
inline constexpr bool is_pointer_like_v =
    pointer_like<std::remove_cv_t<T>>::value && !string_like<T>;

} // namespace deepeq::reflect::details
