#include "portico/raw-chars.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace portico {

RawChars::RawChars(size_type capacity) { reserve(capacity); }

RawChars::RawChars(std::string_view data) { assign(data); }

RawChars::RawChars(const RawChars &rhs) { assign(std::string_view(rhs)); }

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) [[likely]] {
    assign(std::string_view(rhs));
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::append(const_pointer first, const_pointer last) {
  const auto len = static_cast<size_type>(last - first);
  if (len == 0) {
    return;
  }
  ensureAvailableCapacityExponential(len);
  std::memcpy(_buf + _size, first, static_cast<std::size_t>(len));
  _size += len;
}

void RawChars::push_back(char ch) {
  ensureAvailableCapacityExponential(1);
  _buf[_size++] = ch;
}

void RawChars::assign(std::string_view data) {
  _size = 0;
  append(data);
}

void RawChars::erase_front(size_type n) {
  if (n >= _size) {
    _size = 0;
    return;
  }
  std::memmove(_buf, _buf + n, static_cast<std::size_t>(_size - n));
  _size -= n;
}

void RawChars::setSize(size_type newSize) {
  if (newSize > _capacity) [[unlikely]] {
    throw std::out_of_range("RawChars::setSize beyond capacity");
  }
  _size = newSize;
}

void RawChars::addSize(size_type delta) { setSize(_size + delta); }

void RawChars::reserve(size_type newCapacity) {
  if (newCapacity > _capacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) { reserve(_size + availableCapacity); }

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (required > _capacity) {
    reallocUp(std::max(required, _capacity * 2));
  }
}

void RawChars::swap(RawChars &rhs) noexcept {
  std::swap(_buf, rhs._buf);
  std::swap(_size, rhs._size);
  std::swap(_capacity, rhs._capacity);
}

bool RawChars::operator==(const RawChars &rhs) const noexcept {
  return std::string_view(*this) == std::string_view(rhs);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, static_cast<std::size_t>(newCapacity)));
  if (newBuf == nullptr) [[unlikely]] {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace portico
