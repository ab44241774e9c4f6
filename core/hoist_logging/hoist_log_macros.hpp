// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_LOG_MACROS_HPP
#define HOIST_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "hoist_log_severity.hpp"

namespace hoist {
namespace logging {

// Thread-safe severity logger shared by every component
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in hoist_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: HOIST_LOG_INFO("part uploaded" << kv("part", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace hoist

// Define HOIST_LOG_COMPONENT before including this header:
//   #define HOIST_LOG_COMPONENT "transfer_manager"
//   #include <hoist_log_macros.hpp>
#ifndef HOIST_LOG_COMPONENT
#define HOIST_LOG_COMPONENT "hoist"
#endif

// Sinks print the component from this attribute, not from the message text
#define HOIST_LOG_COMPONENT_VALUE \
  ::boost::log::add_value("Component", std::string(HOIST_LOG_COMPONENT))

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define HOIST_LOG_ENABLE_DEBUG 0
#else
#define HOIST_LOG_ENABLE_DEBUG 1
#endif

#define HOIST_LOG_DEBUG(msg) \
  do { \
    if (HOIST_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::hoist::logging::get_logger(), ::hoist::logging::severity_level::debug) \
        << HOIST_LOG_COMPONENT_VALUE << msg; \
    } \
  } while (0)

#define HOIST_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::hoist::logging::get_logger(), ::hoist::logging::severity_level::info) \
      << HOIST_LOG_COMPONENT_VALUE << msg; \
  } while (0)

#define HOIST_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::hoist::logging::get_logger(), ::hoist::logging::severity_level::warn) \
      << HOIST_LOG_COMPONENT_VALUE << msg; \
  } while (0)

#define HOIST_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::hoist::logging::get_logger(), ::hoist::logging::severity_level::error) \
      << HOIST_LOG_COMPONENT_VALUE << msg; \
  } while (0)

#define HOIST_LOG_FATAL(msg) \
  do { \
    BOOST_LOG_SEV(::hoist::logging::get_logger(), ::hoist::logging::severity_level::fatal) \
      << HOIST_LOG_COMPONENT_VALUE << msg; \
  } while (0)

// Attach transfer context to every record emitted from the current scope.
// Each guard gets its own prefix: both are declared on the same source line.
// Usage: HOIST_LOG_SCOPED_TRANSFER(transfer_id, bucket + "/" + key);
#define HOIST_LOG_SCOPED_TRANSFER(transfer_id_val, object_val) \
  [[maybe_unused]] ::boost::log::scoped_attribute BOOST_LOG_UNIQUE_IDENTIFIER_NAME( \
    _hoist_log_transfer_id_guard_ \
  ) = \
    ::boost::log::add_scoped_thread_attribute( \
      "TransferID", ::boost::log::attributes::constant<std::string>(transfer_id_val) \
    ); \
  [[maybe_unused]] ::boost::log::scoped_attribute BOOST_LOG_UNIQUE_IDENTIFIER_NAME( \
    _hoist_log_object_guard_ \
  ) = \
    ::boost::log::add_scoped_thread_attribute( \
      "Object", ::boost::log::attributes::constant<std::string>(object_val) \
    )

// Log every Nth occurrence at a call site
#define HOIST_LOG_DEBUG_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _hoist_log_counter{0}; \
    if ((++_hoist_log_counter % (n)) == 1) { \
      HOIST_LOG_DEBUG(msg); \
    } \
  } while (0)

#define HOIST_LOG_INFO_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _hoist_log_counter{0}; \
    if ((++_hoist_log_counter % (n)) == 1) { \
      HOIST_LOG_INFO(msg); \
    } \
  } while (0)

#define HOIST_LOG_WARN_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _hoist_log_counter{0}; \
    if ((++_hoist_log_counter % (n)) == 1) { \
      HOIST_LOG_WARN(msg); \
    } \
  } while (0)

// Log at most once per interval_sec at a call site
#define HOIST_LOG_THROTTLE_IMPL(level_macro, interval_sec, msg) \
  do { \
    static std::chrono::steady_clock::time_point _hoist_last_log_time{}; \
    static std::mutex _hoist_throttle_mutex; \
    auto _hoist_now = std::chrono::steady_clock::now(); \
    bool _hoist_should_log = false; \
    { \
      std::lock_guard<std::mutex> _hoist_lock(_hoist_throttle_mutex); \
      if (_hoist_now - _hoist_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _hoist_last_log_time = _hoist_now; \
        _hoist_should_log = true; \
      } \
    } \
    if (_hoist_should_log) { \
      level_macro(msg); \
    } \
  } while (0)

#define HOIST_LOG_INFO_THROTTLE(interval_sec, msg) \
  HOIST_LOG_THROTTLE_IMPL(HOIST_LOG_INFO, interval_sec, msg)
#define HOIST_LOG_WARN_THROTTLE(interval_sec, msg) \
  HOIST_LOG_THROTTLE_IMPL(HOIST_LOG_WARN, interval_sec, msg)
#define HOIST_LOG_ERROR_THROTTLE(interval_sec, msg) \
  HOIST_LOG_THROTTLE_IMPL(HOIST_LOG_ERROR, interval_sec, msg)

#endif  // HOIST_LOG_MACROS_HPP
