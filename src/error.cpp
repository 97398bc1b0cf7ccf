#include "cuesheet/error.hpp"

#include <string>

namespace cuesheet {

Error::Error(const std::string &message) : message(message) {}

} // namespace cuesheet
