#pragma once

#include "transfer/Report.hpp"
#include "verify/Report.hpp"

#include <filesystem>
#include <string>

namespace sm::shell {

// Human-readable summary with the failed relative paths and their kind.
std::string renderRunReport(const transfer::RunReport& report);

std::string renderVerifyReport(const verify::Report& report, const std::filesystem::path& root);

}
