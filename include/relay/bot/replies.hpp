#pragma once

#include "relay/transfer/types.hpp"

#include <string>

namespace relay::bot {

std::string welcome_text();
std::string help_text();

/// Acknowledgement sent as soon as a transfer is queued.
std::string downloading_text();

std::string unknown_command_text();

/// "✅ Uploaded!\n<name>\n<link>" or "❌ Error: <Kind>: <message>".
std::string format_result(const transfer::TransferResult& result);

} // namespace relay::bot
