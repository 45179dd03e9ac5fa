#include "bounded_flow/errors.hpp"

namespace bounded_flow {

namespace errors {
namespace {
struct bounded_flow_err_cat : std::error_category {
   public:
    const char* name() const noexcept override { return "bounded_flow"; }
    std::string message(int ev) const override {
        switch (static_cast<bounded_flow_err>(ev)) {
            case bounded_flow_err::not_called:
                return "not_called";
            case bounded_flow_err::write_after_end:
                return "write_after_end";
            case bounded_flow_err::stream_closed:
                return "stream_closed";
            default:
                return "unrecognized error";
        }
    }
};

const bounded_flow_err_cat the_bounded_flow_category;
}  // namespace

std::error_code make_error_code(bounded_flow_err e) {
    return {static_cast<int>(e), the_bounded_flow_category};
}

}  // namespace errors

}  // namespace bounded_flow
