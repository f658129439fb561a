#pragma once

#include <any>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace portico {

// Heterogeneous key / value store shared by all requests of a connection.
// It starts as a copy of what the lifespan startup handler stored, so that a connection never observes changes made
// by another one.
class StateBag {
 public:
  template <class T>
  void set(std::string_view key, T&& value) {
    _values.insert_or_assign(std::string(key), std::any(std::forward<T>(value)));
  }

  // Returns a pointer to the stored value if present and of type T, nullptr otherwise.
  template <class T>
  [[nodiscard]] T* find(std::string_view key) noexcept {
    auto it = _values.find(key);
    return it == _values.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  template <class T>
  [[nodiscard]] const T* find(std::string_view key) const noexcept {
    auto it = _values.find(key);
    return it == _values.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return _values.contains(key); }

  bool erase(std::string_view key);

  [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }

  [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

  void clear() noexcept { _values.clear(); }

 private:
  std::map<std::string, std::any, std::less<>> _values;
};

}  // namespace portico
