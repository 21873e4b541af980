#include "cadence/runtime/controller.h"

namespace cadence {

std::string describe_exception(std::exception_ptr error) {
    if (!error) {
        return "no exception";
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace cadence
