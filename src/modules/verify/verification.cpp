// modules/verify/verification.cpp
#include "verify/verification.h"
#include "common/utils/string_utils.h"

namespace planflow {

bool VerificationEvaluator::verify(const std::optional<VerifySpec>& spec, std::string_view output,
                                   bool externally_confirmed) const {
    if (!spec) return true;

    switch (spec->type) {
        case VerifyType::OUTPUT_CONTAINS:
            return contains_ci(output, spec->value);
        case VerifyType::OUTPUT_NOT_CONTAINS:
            return !contains_ci(output, spec->value);
        case VerifyType::EXIT_CODE_ZERO:
            // heuristic: tool output carries no exit status of its own
            return !contains_ci(output, "error") && !contains_ci(output, "exit code");
        case VerifyType::ANY_OUTPUT:
            return !trim(output).empty();
        case VerifyType::FILE_EXISTS:
        case VerifyType::MANUAL:
            return policy_.permissive_external_checks || externally_confirmed;
    }
    return true;
}

std::string VerificationEvaluator::describe(const VerifySpec& spec) {
    if (spec.type == VerifyType::MANUAL) return "";
    std::string desc(to_string(spec.type));
    if (!spec.value.empty()) {
        desc += ": " + spec.value;
    }
    return desc;
}

} // namespace planflow
