#pragma once
#include <string>

// Installs the "mail-rag" default logger: colour stdout, plus `file` when
// non-empty. Unknown levels fall back to info.
void init_logging(const std::string& level, const std::string& file = "");
