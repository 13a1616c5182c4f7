#pragma once

#include "spanx/core/http.hpp"
#include "spanx/core/json.hpp"
#include "spanx/core/span.hpp"

#include <string>
#include <string_view>

namespace spanx_dump {

std::string escape_json(std::string_view sv);
std::string span_json(spanx::span s);

// Span trees rendered as JSON; every node carries "span":[start,end].
std::string dump_request(const spanx::spanned<spanx::http::request>& req);
std::string dump_response(const spanx::spanned<spanx::http::response>& res);
std::string dump_json(const spanx::spanned<spanx::json::value>& root);

} // namespace spanx_dump
