#pragma once

#include <string>
#include <core/types.hpp>

// Reject names git would refuse as a branch, or would read as an option or a
// revision expression rather than a plain ref. Fails with Validation.
Result<void> validate_branch_name(const std::string& name);
