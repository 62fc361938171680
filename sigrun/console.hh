#pragma once

#include <string>

namespace sigrun::console {

// Severity of a logged message
enum class Level { log, warn, error };

// Receives all logged messages instead of the default output, if set.
// Default output is the JS console in the browser and std::clog otherwise.
extern void (*sink)(Level, const std::string&);

// Log string to the console
void log(const std::string&);

// Log string to the console as warning
void warn(const std::string&);

// Log string to the console as error
void error(const std::string&);
}
