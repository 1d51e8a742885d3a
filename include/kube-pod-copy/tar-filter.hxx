/**
 * @file tar-filter.hxx
 * @brief Boost.Iostreams filter yielding the file contents of a tar stream.
 */

#pragma once

#include <kube-pod-copy/detail/tar-filter-impl.hxx>
#include <boost/iostreams/filter/symmetric.hpp>

namespace kube_pod_copy {
/**
 * @brief Boost.Iostreams-compatible symmetric filter that extracts file
 * contents from a TAR archive stream.
 *
 * Headers, padding, directory entries and name extension records are dropped;
 * the payloads of regular file entries are concatenated. In
 * TarFilterMode::SingleFile the archive must hold exactly one regular file:
 * applied to the output of `tar -cf - -C <dir> <file>` it yields exactly the
 * file content, which is how PodCopy exposes a remote file as a plain input
 * stream, and a remote directory fails instead of yielding joined files.
 *
 * Unlike a plain parser, the filter refuses to end silently: if the upstream
 * source runs dry inside a header or payload the read raises
 * DecodeError::Kind::Truncated instead of returning a short file.
 *
 * @tparam Alloc Allocator type for internal buffers (default:
 * std::allocator<char>)
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * io::filtering_istream in;
 * in.push(kube_pod_copy::TarFilter<>());
 * in.push(io::file_source("nginx-conf.tar", std::ios::binary));
 * std::string config((std::istreambuf_iterator<char>(in)),
 *                    std::istreambuf_iterator<char>());
 * @endcode
 */
template <typename Alloc = std::allocator<char>>
struct TarFilter
    : boost::iostreams::symmetric_filter<detail::TarFilterImpl<Alloc>, Alloc> {
private:
  using impl_type = detail::TarFilterImpl<Alloc>;
  using base_type = boost::iostreams::symmetric_filter<impl_type, Alloc>;

public:
  /// Character type used by the stream.
  using char_type = typename base_type::char_type;
  /// Filter category for Boost.Iostreams.
  using category = typename base_type::category;

  /**
   * @brief Constructs the TAR filter with optional buffer size.
   *
   * @param buffer_size Buffer size used internally (defaults to
   * Boost.Iostreams' default size).
   * @param mode Entries the filter accepts.
   */
  explicit TarFilter(std::streamsize buffer_size =
                         boost::iostreams::default_device_buffer_size,
                     TarFilterMode mode = TarFilterMode::AllFiles)
      : base_type(buffer_size, mode) {}
};

/// @brief Makes TarFilter pipable in Boost.Iostreams pipelines.
BOOST_IOSTREAMS_PIPABLE(TarFilter<>, 0);
} // namespace kube_pod_copy
