#pragma once

#include <mcp_relay/registry/tool_registry.hpp>
#include <mcp_relay/relay/live_connection.hpp>
#include <mcp_relay/relay/relay_engine.hpp>

#include <memory>
#include <optional>
#include <string>

namespace mcp_relay {

// A tool answered by the operator. The channel is held weakly; once it is
// gone the call ends like a failed delivery (empty content).
Tool MakeRelayTool(ToolDescriptor descriptor,
                   std::weak_ptr<ConnectionChannel> channel,
                   std::shared_ptr<const RelayEngine> engine);

// Wrap a tool so each call is mirrored to the live connection: a
// toolDefinition and a toolRequest before the call, a toolResponse after it.
// The wrapped tool's result is returned unchanged. With `response_field` the
// mirrored text is that field of the first content item, otherwise the
// serialized content list.
Tool WrapWithObserver(Tool inner,
                      std::weak_ptr<ConnectionChannel> channel,
                      std::optional<std::string> response_field = std::nullopt);

} // namespace mcp_relay
