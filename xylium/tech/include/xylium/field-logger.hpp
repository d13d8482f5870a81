#pragma once

#include <fmt/format.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/log.hpp"
#include "xylium/vector.hpp"

namespace xylium {

// Thin wrapper over a spdlog logger that carries structured key/value fields.
// Fields are rendered after the message as " {key=value key2=value2}".
// A FieldLogger is a cheap value: copies share the same underlying spdlog logger.
class FieldLogger {
 public:
  using Field = std::pair<std::string, std::string>;

  // Uses spdlog default logger.
  FieldLogger();

  // Uses given logger, or spdlog default logger if null.
  explicit FieldLogger(std::shared_ptr<log::logger> logger);

  // Returns a new FieldLogger with the additional field. An existing field with the same key is overwritten.
  [[nodiscard]] FieldLogger withField(std::string_view key, std::string_view value) const;

  [[nodiscard]] FieldLogger withFields(std::initializer_list<Field> fields) const;

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
    emit(log::level::trace, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
    emit(log::level::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) const {
    emit(log::level::info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
    emit(log::level::warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) const {
    emit(log::level::err, fmt, std::forward<Args>(args)...);
  }

  [[nodiscard]] bool shouldLog(log::level::level_enum level) const { return _logger->should_log(level); }

  [[nodiscard]] const std::shared_ptr<log::logger>& underlying() const noexcept { return _logger; }

  [[nodiscard]] const vector<Field>& fields() const noexcept { return _fields; }

  // Returns the value of given field, or an empty string_view if absent.
  [[nodiscard]] std::string_view field(std::string_view key) const noexcept;

 private:
  template <typename... Args>
  void emit(log::level::level_enum level, fmt::format_string<Args...> fmt, Args&&... args) const {
    if (!_logger->should_log(level)) {
      return;
    }
    if (_fields.empty()) {
      _logger->log(level, fmt, std::forward<Args>(args)...);
    } else {
      _logger->log(level, "{} {}", fmt::format(fmt, std::forward<Args>(args)...), renderFields());
    }
  }

  [[nodiscard]] std::string renderFields() const;

  std::shared_ptr<log::logger> _logger;
  vector<Field> _fields;
};

}  // namespace xylium
