#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace ump {

/**
 * Owning, growable byte buffer backed by malloc / realloc.
 * Used for part payloads and for the decoder's retained bytes between chunks.
 * Growth is exponential when appending, exact when reserving.
 */
class RawBytes {
 public:
  using value_type = std::byte;
  using size_type = std::size_t;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using iterator = value_type *;
  using const_iterator = const value_type *;
  using view_type = std::span<const std::byte>;

  RawBytes() noexcept = default;

  explicit RawBytes(size_type capacity);

  explicit RawBytes(view_type data);

  RawBytes(const_pointer first, const_pointer last);

  RawBytes(const RawBytes &rhs);
  RawBytes(RawBytes &&rhs) noexcept;

  RawBytes &operator=(const RawBytes &rhs);
  RawBytes &operator=(RawBytes &&rhs) noexcept;

  ~RawBytes();

  void append(const_pointer first, const_pointer last);

  void append(const_pointer data, size_type sz) { append(data, data + sz); }

  void append(view_type data) { append(data.data(), data.data() + data.size()); }

  void assign(view_type data);

  // Removes the first n bytes, shifting the remaining ones to the front.
  void erase_front(size_type n);

  void clear() noexcept { _size = 0; }

  // Frees the underlying storage.
  void release() noexcept;

  void reserve(size_type newCapacity);

  void ensureAvailableCapacityExponential(size_type availableCapacity);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] view_type view() const noexcept { return {_buf, _size}; }

  // Convenience for logging and tests, payloads are not text in general.
  [[nodiscard]] std::string_view asStringView() const noexcept {
    return {reinterpret_cast<const char *>(_buf), _size};
  }

  operator view_type() const noexcept { return view(); }

  value_type &operator[](size_type pos) { return _buf[pos]; }
  value_type operator[](size_type pos) const { return _buf[pos]; }

  void swap(RawBytes &rhs) noexcept;

  bool operator==(const RawBytes &rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawBytes &lhs, RawBytes &rhs) noexcept { lhs.swap(rhs); }

}  // namespace ump
