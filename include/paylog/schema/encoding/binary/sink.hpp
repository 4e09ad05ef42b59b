#pragma once
#include <paylog/schema/primitives.hpp>

namespace paylog::schema::encoding::binary {

/// Destination for encoded bytes.
///
/// A sink that cannot accept a write throws
/// store_error{serialization_failure}; the writer does not catch it.
struct sink {
  virtual ~sink() = default;
  virtual void write(const paylog::schema::bytes_view_t& bytes) = 0;
};

/// Appends to a caller owned buffer.
class vector_sink final : public sink {
 public:
  explicit vector_sink(paylog::schema::bytes_t& out) : out_{out} {}

  void write(const paylog::schema::bytes_view_t& bytes) override;

 private:
  paylog::schema::bytes_t& out_;
};

}  // namespace paylog::schema::encoding::binary
