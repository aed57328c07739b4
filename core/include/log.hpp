#pragma once
#include <string>

// Configures spdlog's default logger. An empty level reads RAGDESK_LOG_LEVEL,
// falling back to "info".
void init_logging(const std::string& level = {});
