#include "ump/raw-bytes.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <utility>

namespace ump {

RawBytes::RawBytes(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawBytes::RawBytes(view_type data) : RawBytes(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawBytes::RawBytes(const_pointer first, const_pointer last) : RawBytes(view_type(first, last)) {}

RawBytes::RawBytes(const RawBytes &rhs) : RawBytes(rhs.view()) {}

RawBytes::RawBytes(RawBytes &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawBytes &RawBytes::operator=(const RawBytes &rhs) {
  if (this != &rhs) {
    assign(rhs.view());
  }
  return *this;
}

RawBytes &RawBytes::operator=(RawBytes &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawBytes::~RawBytes() { std::free(_buf); }

void RawBytes::append(const_pointer first, const_pointer last) {
  assert(first <= last);
  if (first == last) {
    return;
  }
  const auto sz = static_cast<size_type>(last - first);
  ensureAvailableCapacityExponential(sz);
  std::memcpy(_buf + _size, first, sz);
  _size += sz;
}

void RawBytes::assign(view_type data) {
  // data may alias our own storage (assigning a tail of ourselves).
  if (!data.empty() && data.data() >= _buf && data.data() < _buf + _size) {
    std::memmove(_buf, data.data(), data.size());
    _size = data.size();
    return;
  }
  _size = 0;
  append(data);
}

void RawBytes::erase_front(size_type n) {
  assert(n <= _size);
  if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

void RawBytes::release() noexcept {
  std::free(_buf);
  _buf = nullptr;
  _size = 0;
  _capacity = 0;
}

void RawBytes::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawBytes::ensureAvailableCapacityExponential(size_type availableCapacity) {
  if (std::numeric_limits<size_type>::max() - _size < availableCapacity) {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    size_type newCapacity = _capacity > std::numeric_limits<size_type>::max() / 2U ? required : _capacity * 2U;
    // NOLINTNEXTLINE(readability-use-std-min-max)
    if (newCapacity < required) {
      newCapacity = required;
    }
    reallocUp(newCapacity);
  }
}

void RawBytes::swap(RawBytes &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

bool RawBytes::operator==(const RawBytes &rhs) const noexcept {
  if (_size != rhs._size) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even for a zero size
  return _size == 0 || std::memcmp(_buf, rhs._buf, _size) == 0;
}

void RawBytes::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace ump
