#pragma once
#include <string>

// Opaque phase identity; compared and hashed as a string.
using PhaseId = std::string;
