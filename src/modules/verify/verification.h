// modules/verify/verification.h
#ifndef PLANFLOW_MODULES_VERIFY_VERIFICATION_H
#define PLANFLOW_MODULES_VERIFY_VERIFICATION_H

#include "core/types/plan.h"
#include <optional>
#include <string>
#include <string_view>

namespace planflow {

// Decides pass/fail of a task node from raw tool output text.
// All substring checks are case-insensitive.
class VerificationEvaluator {
public:
    struct Policy {
        // When false, file_exists / manual need an explicit external confirmation.
        bool permissive_external_checks = true;
    };

    VerificationEvaluator() = default;
    explicit VerificationEvaluator(Policy policy) : policy_(policy) {}

    bool verify(const std::optional<VerifySpec>& spec, std::string_view output,
                bool externally_confirmed = false) const;

    // "output_contains: done" style text for the status block; empty for manual checks.
    static std::string describe(const VerifySpec& spec);

private:
    Policy policy_;
};

} // namespace planflow

#endif // PLANFLOW_MODULES_VERIFY_VERIFICATION_H
