#pragma once

#include "base-tar-filter-impl.hxx"
#include <memory>

namespace kube_pod_copy::detail {
/**
 * @brief TAR payload filter adapter templated on allocator/char type.
 *
 * Thin adapter over BaseTarFilterImpl with the interface
 * boost::iostreams::symmetric_filter expects.
 *
 * @tparam Alloc Allocator type whose value_type defines the char_type (defaults
 * to std::allocator<char>).
 */
template <typename Alloc = std::allocator<char>>
class TarFilterImpl : public BaseTarFilterImpl {
public:
  using char_type = typename Alloc::value_type;

  explicit TarFilterImpl(TarFilterMode mode = TarFilterMode::AllFiles)
      : BaseTarFilterImpl(mode) {}

  /**
   * @brief Cast the char_type buffers to plain char, delegate to
   * BaseTarFilterImpl::filter and write the advanced pointers back.
   */
  bool filter(const char_type *&src_begin, const char_type *const src_end,
              char_type *&dest_begin, const char_type *const dest_end,
              bool flush) {
    auto src_b = reinterpret_cast<const char *>(src_begin);
    auto src_e = reinterpret_cast<const char *>(src_end);
    auto dest_b = reinterpret_cast<char *>(dest_begin);
    auto dest_e = reinterpret_cast<const char *>(dest_end);

    bool result =
        BaseTarFilterImpl::filter(src_b, src_e, dest_b, dest_e, flush);

    src_begin = reinterpret_cast<const char_type *>(src_b);
    dest_begin = reinterpret_cast<char_type *>(dest_b);

    return result;
  }

  void close() { BaseTarFilterImpl::close(); }
};
} // namespace kube_pod_copy::detail
