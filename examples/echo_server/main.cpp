/// Echo server: minimal tool server demonstrating tool registration.
/// Usage: ./echo_server [--log-level debug] [--workers N]
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <toolhost/toolhost.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace {

constexpr int64_t MAX_DELAY_MS = 60000;

} // anonymous namespace

int main(int argc, char** argv) {
    toolhost::ServerConfig defaults;
    defaults.server_info = {"echo-server", "1.0.0"};

    return toolhost::run_stdio_server(argc, argv, std::move(defaults), [](toolhost::ToolServer& server) {
        toolhost::PropertySchema text;
        text.name = "text";
        text.description = "The text to echo";
        text.required = true;

        toolhost::ToolDefinition echo;
        echo.name = "echo";
        echo.description = "Echo the input text back to the caller";
        echo.input_schema.properties = {text};

        server.add_tool(echo, [](const nlohmann::json& args) {
            return toolhost::CallToolResult::text(args.at("text").get<std::string>());
        });

        // Same as echo, after a delay; slow calls never reorder responses.
        toolhost::PropertySchema delay;
        delay.name = "delay_ms";
        delay.type = toolhost::PropertyType::Integer;
        delay.description = "Milliseconds to wait before answering (0-60000)";
        delay.default_value = 0;

        toolhost::ToolDefinition sleep_echo;
        sleep_echo.name = "sleep_echo";
        sleep_echo.description = "Echo the input text after waiting delay_ms milliseconds";
        sleep_echo.input_schema.properties = {text, delay};

        server.add_tool(sleep_echo, [](const nlohmann::json& args) {
            auto ms = args.at("delay_ms").get<int64_t>();
            if (ms < 0 || ms > MAX_DELAY_MS) {
                throw toolhost::ToolError("delay_ms must be between 0 and " + std::to_string(MAX_DELAY_MS));
            }
            if (ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            }
            return toolhost::CallToolResult::text(args.at("text").get<std::string>());
        });
    });
}
