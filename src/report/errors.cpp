#include "errors.hpp"

#include <fmt/format.h>

namespace tally {
namespace report {

// ReportError のエラーメッセージフォーマット
std::string ReportError::format_error(Kind kind, const std::string& message) {
    std::string kind_str;
    switch (kind) {
        case Kind::NO_CURRENT_UNIT:
            kind_str = "No current unit";
            break;
        case Kind::MALFORMED_TABLE:
            kind_str = "Malformed table";
            break;
        case Kind::SCHEMA_FROZEN:
            kind_str = "Schema frozen";
            break;
    }
    return fmt::format("[REPORT] {}: {}", kind_str, message);
}

}  // namespace report
}  // namespace tally
