#include "spanx/core/json.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace {

constexpr size_t MAX_INPUT_SIZE = 64 * 1024;

class span_checker : public spanx::json::visitor {
public:
    explicit span_checker(size_t size) : size_(size) {}

    void visit_value(const spanx::spanned<spanx::json::value>& node) override {
        if (node.span.end() > size_) {
            std::abort();
        }
        visitor::visit_value(node);
    }

private:
    size_t size_;
};

} // namespace

extern "C" int32_t LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > MAX_INPUT_SIZE) {
        return 0;
    }

    spanx::json::json_options opts;
    opts.max_depth = 64;
    auto result = spanx::json::parse_json(std::span<const uint8_t>(data, size), opts);
    if (!result) {
        if (result.error().offset > size) {
            std::abort();
        }
        return 0;
    }

    span_checker checker(size);
    checker.visit_value(*result);
    [[maybe_unused]] const auto* first = (*result)->get("0");
    return 0;
}
