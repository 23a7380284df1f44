#pragma once
#include <drogon/HttpFilter.h>

namespace sqlscope::filters {

class token_filter : public drogon::HttpFilter<token_filter> {
 public:
  void doFilter(const drogon::HttpRequestPtr& req,
                drogon::FilterCallback&& fcb,
                drogon::FilterChainCallback&& fccb) override;
};

}
