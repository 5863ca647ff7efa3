#pragma once

#include <string>

namespace cloudlink::io {

// PowerShell serializes progress and error streams as "#< CLIXML" documents when it
// is not attached to a console. These helpers reduce such output to plain text.

std::string trimCopy(const std::string &value);
std::string decodeClixmlEscapes(const std::string &value);
std::string cleanCommandOutput(const std::string &raw);
std::string cleanCommandErrors(const std::string &raw);

} // namespace cloudlink::io
