#pragma once
#include <functional>
#include <string>

namespace web_archiver {

// (message, percent). Percent is -1 for errors.
using ProgressCallback = std::function<void(const std::string&, int)>;

} // namespace web_archiver
