#include "CommandErrors.hpp"

int AbortSignal::process_exit_code() const {
    try {
        size_t consumed = 0;
        int code = std::stoi(exit_code_, &consumed);
        if (consumed == exit_code_.size()) {
            return code;
        }
    } catch (const std::exception&) {
    }
    return 1;
}
