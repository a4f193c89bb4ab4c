#include "backscan/core/exception.h"
#include <sstream>

namespace backscan {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_INVALID_INPUT:
            return "ERROR_INVALID_INPUT";
        case ResultCode::ERROR_INVALID_FORMAT:
            return "ERROR_INVALID_FORMAT";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_MEMORY_ALLOCATION:
            return "ERROR_MEMORY_ALLOCATION";
        default:
            return "UNKNOWN_ERROR";
    }
}

ExitStatus exitStatusFor(const std::exception& e) noexcept {
    if (dynamic_cast<const FileException*>(&e) != nullptr) {
        return ExitStatus::FILE_ERROR;
    }
    if (dynamic_cast<const InputException*>(&e) != nullptr) {
        return ExitStatus::INPUT_ERROR;
    }
    if (dynamic_cast<const ConfigException*>(&e) != nullptr) {
        return ExitStatus::CONFIG_ERROR;
    }
    return ExitStatus::UNEXPECTED;
}

} // namespace core
} // namespace backscan
