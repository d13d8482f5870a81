#pragma once

#include <string>

namespace xylium::http {

struct Header {
  std::string name;
  std::string value;
};

}  // namespace xylium::http
