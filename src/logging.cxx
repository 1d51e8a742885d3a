#include <kube-pod-copy/logging.hxx>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <iostream>
#include <mutex>

namespace kube_pod_copy {
namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

namespace {
using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;

std::mutex sink_mutex;
boost::shared_ptr<console_sink> installed_sink;
bool filter_configured = false;
} // unnamed namespace

void init_logging(const LogOptions &options) {
  std::lock_guard<std::mutex> lock(sink_mutex);
  auto core = logging::core::get();

  if (installed_sink) {
    core->remove_sink(installed_sink);
    installed_sink.reset();
  }

  logging::add_common_attributes();

  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(
      boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<console_sink>(backend);
  if (options.timestamps) {
    sink->set_formatter(
        expr::stream << "["
                     << expr::format_date_time<boost::posix_time::ptime>(
                            "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                     << "] [" << logging::trivial::severity << "] "
                     << expr::smessage);
  } else {
    sink->set_formatter(expr::stream << "[" << logging::trivial::severity
                                     << "] " << expr::smessage);
  }

  core->add_sink(sink);
  core->set_filter(logging::trivial::severity >= options.min_severity);
  installed_sink = sink;
  filter_configured = true;
}

namespace detail {
void ensure_default_log_filter() {
  std::lock_guard<std::mutex> lock(sink_mutex);
  if (filter_configured)
    return;
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   logging::trivial::warning);
  filter_configured = true;
}
} // namespace detail
} // namespace kube_pod_copy
