#pragma once
#include <string>
#include <vector>

namespace ProcessUtils {
// Absolute path of an executable found on PATH, or "" when absent.
std::string findExecutableInPath(const std::string& command);

/**
 * @brief Runs executable with args and waits for it.
 * @param stderrPath file receiving the child's stderr; "" sends stdout and stderr to /dev/null.
 * @return The child's exit code, or -1 when it could not be spawned or did not exit normally.
 */
int spawnAndWait(const std::string& executable,
                 const std::vector<std::string>& args,
                 const std::string& stderrPath = "");
}
