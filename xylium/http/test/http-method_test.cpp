#include "xylium/http-method.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

#include "../src/http-method-parse.hpp"

namespace xylium::http {

TEST(HttpMethod, MethodIdxRoundTrip) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    EXPECT_EQ(MethodToIdx(method), methodIdx);
    EXPECT_EQ(MethodToStr(method), MethodIdxToStr(methodIdx));
  }
}

TEST(HttpMethod, Bitmap) {
  const MethodBmp bmp = Method::GET | Method::POST;
  EXPECT_TRUE(IsMethodSet(bmp, Method::GET));
  EXPECT_TRUE(IsMethodSet(bmp, Method::POST));
  EXPECT_FALSE(IsMethodSet(bmp, Method::PUT));
  EXPECT_TRUE(IsMethodIdxSet(bmp | Method::PATCH, MethodToIdx(Method::PATCH)));
}

TEST(HttpMethod, ParseIsCaseInsensitive) {
  EXPECT_EQ(MethodStrToOptEnum("GET"), Method::GET);
  EXPECT_EQ(MethodStrToOptEnum("delete"), Method::DELETE);
  EXPECT_EQ(MethodStrToOptEnum("oPtIoNs"), Method::OPTIONS);
  EXPECT_EQ(MethodStrToOptEnum("BREW"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum(""), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("GETS"), std::nullopt);
}

TEST(HttpMethod, MethodIdxByNameIsSorted) {
  static constexpr std::array<std::string_view, kNbMethods> kExpected = {
      "CONNECT", "DELETE", "GET", "HEAD", "OPTIONS", "PATCH", "POST", "PUT", "TRACE"};
  for (std::size_t pos = 0; pos < kNbMethods; ++pos) {
    EXPECT_EQ(MethodIdxToStr(kMethodIdxByName[pos]), kExpected[pos]);
  }
}

}  // namespace xylium::http
