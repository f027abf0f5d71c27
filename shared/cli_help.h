#ifndef CLI_HELP_H
#define CLI_HELP_H

#include <string>

namespace TabBridgeCLI {

/**
 * Generate complete help text for command-line usage
 * @param programName Name of the executable
 * @return Formatted help text string ready for console output
 */
std::string generateHelpText(const char* programName);

/**
 * Generate version string
 * @return Version string in format "tabbridge version X.Y.Z"
 */
std::string generateVersionString();

} // namespace TabBridgeCLI

#endif // CLI_HELP_H
