// Repository: LumenSync
// Component: Process Exit Codes
// Purpose: Exit statuses an operator or supervisor can act on.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_EXIT_CODES_HPP_
#define LUMENSYNC_CORE_EXIT_CODES_HPP_

namespace lumensync::core {

enum ExitCode : int {
  kExitOk = 0,                // graceful shutdown (signal or control request)
  kExitUsage = 1,             // bad flags or configuration, startup only
  kExitDeviceLost = 10,       // TV lost after streaming, error threshold exhausted
  kExitDeviceNeverFound = 11, // TV never answered: startup window or threshold exhausted
  kExitVerifyFailed = 12,     // --verify probe failed
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_EXIT_CODES_HPP_
