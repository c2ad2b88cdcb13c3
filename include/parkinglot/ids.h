#pragma once

#include <string>

namespace parkinglot {

// Random (version 4) UUID in its 36-character textual form.
std::string newUUID();

}  // namespace parkinglot
