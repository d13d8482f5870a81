#include "xylium/field-logger.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "xylium/log.hpp"

namespace xylium {

FieldLogger::FieldLogger() : _logger(log::default_logger()) {}

FieldLogger::FieldLogger(std::shared_ptr<log::logger> logger)
    : _logger(logger ? std::move(logger) : log::default_logger()) {}

FieldLogger FieldLogger::withField(std::string_view key, std::string_view value) const {
  FieldLogger ret(*this);
  for (Field& field : ret._fields) {
    if (field.first == key) {
      field.second.assign(value);
      return ret;
    }
  }
  ret._fields.emplace_back(std::string(key), std::string(value));
  return ret;
}

FieldLogger FieldLogger::withFields(std::initializer_list<Field> fields) const {
  FieldLogger ret(*this);
  for (const Field& field : fields) {
    ret = ret.withField(field.first, field.second);
  }
  return ret;
}

std::string_view FieldLogger::field(std::string_view key) const noexcept {
  for (const Field& field : _fields) {
    if (field.first == key) {
      return field.second;
    }
  }
  return {};
}

std::string FieldLogger::renderFields() const {
  std::string out(1, '{');
  for (const Field& field : _fields) {
    if (out.size() > 1) {
      out.push_back(' ');
    }
    out.append(field.first);
    out.push_back('=');
    out.append(field.second);
  }
  out.push_back('}');
  return out;
}

}  // namespace xylium
