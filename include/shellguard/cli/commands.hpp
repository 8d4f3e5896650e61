#pragma once

namespace shellguard::cli {

/// Exit codes: 0 success or Approved, 1 error or Rejected, 2 RequiresApproval.
int run_cli(int argc, char **argv);

} // namespace shellguard::cli
