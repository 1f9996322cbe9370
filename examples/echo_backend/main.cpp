/// Demo backend for manual end-to-end runs of mcpbridge.
/// Usage: ./mcpbridge_echo_backend --listen /tmp/mcpbridge-backend.sock
/// Tools: echo, add, fail. Prompt: greeting.

#include <mcpbridge/mcpbridge.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>

namespace v1 = mcpbridge::v1;
using mcpbridge::PluginRequest;
using mcpbridge::PluginResponse;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

google::protobuf::Value string_value(const std::string& s) {
    google::protobuf::Value v;
    v.set_string_value(s);
    return v;
}

google::protobuf::Value number_value(double d) {
    google::protobuf::Value v;
    v.set_number_value(d);
    return v;
}

google::protobuf::Value schema_property(const std::string& type, const std::string& description) {
    google::protobuf::Value v;
    auto& fields = *v.mutable_struct_value()->mutable_fields();
    fields["type"] = string_value(type);
    fields["description"] = string_value(description);
    return v;
}

v1::ToolDefinition make_tool(const std::string& name, const std::string& description,
                             const std::map<std::string, google::protobuf::Value>& properties) {
    v1::ToolDefinition def;
    def.set_name(name);
    def.set_description(description);
    auto& schema = *def.mutable_input_schema()->mutable_fields();
    schema["type"] = string_value("object");
    google::protobuf::Value props;
    for (const auto& p : properties) {
        (*props.mutable_struct_value()->mutable_fields())[p.first] = p.second;
    }
    schema["properties"] = props;
    return def;
}

double number_arg(const v1::ToolRequest& call, const std::string& key) {
    auto it = call.arguments().fields().find(key);
    if (it == call.arguments().fields().end()) return 0.0;
    return it->second.number_value();
}

v1::ToolResponse call_tool(const v1::ToolRequest& call) {
    v1::ToolResponse resp;
    const auto& args = call.arguments().fields();
    if (call.tool_name() == "echo") {
        auto it = args.find("text");
        resp.set_success(true);
        (*resp.mutable_result()->mutable_fields())["text"] =
            string_value(it != args.end() ? it->second.string_value() : "");
    } else if (call.tool_name() == "add") {
        resp.set_success(true);
        (*resp.mutable_result()->mutable_fields())["sum"] =
            number_value(number_arg(call, "a") + number_arg(call, "b"));
    } else if (call.tool_name() == "fail") {
        resp.set_success(false);
        resp.set_error_code("demo_failure");
        auto it = args.find("message");
        if (it != args.end()) resp.set_error_message(it->second.string_value());
    } else {
        resp.set_success(false);
        resp.set_error_code("unknown_tool");
        resp.set_error_message("unknown tool: " + call.tool_name());
    }
    return resp;
}

v1::PromptGetResponse get_prompt(const v1::PromptGetRequest& get) {
    v1::PromptGetResponse resp;
    if (get.prompt_name() != "greeting") {
        resp.set_description("unknown prompt: " + get.prompt_name());
        return resp;
    }
    auto it = get.arguments().find("name");
    std::string name = it != get.arguments().end() ? it->second : "world";
    resp.set_description("A friendly greeting");
    auto* msg = resp.add_messages();
    msg->set_role("user");
    msg->mutable_content()->set_type("text");
    msg->mutable_content()->set_text("Say hello to " + name + ".");
    return resp;
}

PluginResponse handle(const PluginRequest& req) {
    PluginResponse resp;
    switch (req.request_case()) {
        case PluginRequest::kListTools: {
            auto* list = resp.mutable_list_tools();
            *list->add_tools() = make_tool("echo", "Echo the input text back",
                {{"text", schema_property("string", "Text to echo")}});
            *list->add_tools() = make_tool("add", "Add two numbers",
                {{"a", schema_property("number", "First operand")},
                 {"b", schema_property("number", "Second operand")}});
            *list->add_tools() = make_tool("fail", "Always fails",
                {{"message", schema_property("string", "Failure message")}});
            break;
        }
        case PluginRequest::kToolCall:
            spdlog::info("tool_call {} from {}", req.tool_call().tool_name(),
                         req.tool_call().caller_plugin());
            *resp.mutable_tool_call() = call_tool(req.tool_call());
            break;
        case PluginRequest::kListPrompts: {
            auto* def = resp.mutable_list_prompts()->add_prompts();
            def->set_name("greeting");
            def->set_description("Greet someone by name");
            auto* arg = def->add_arguments();
            arg->set_name("name");
            arg->set_description("Who to greet");
            arg->set_required(true);
            break;
        }
        case PluginRequest::kPromptGet:
            *resp.mutable_prompt_get() = get_prompt(req.prompt_get());
            break;
        case PluginRequest::REQUEST_NOT_SET:
            spdlog::warn("request {} carries no payload", req.request_id());
            break;
    }
    return resp;
}

int listen_unix(const std::string& path) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("socket path too long: " + path);
    }
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket: ") + strerror(errno));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    ::unlink(path.c_str());
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(fd, 4) < 0) {
        std::string msg = std::string("bind ") + path + ": " + strerror(errno);
        ::close(fd);
        throw std::runtime_error(msg);
    }
    return fd;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLI::App app{"mcpbridge demo backend"};

    std::string listen_path = "/tmp/mcpbridge-backend.sock";
    std::string log_level = "info";
    app.add_option("--listen", listen_path, "Unix socket path to listen on");
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stderr_color_mt("echo-backend");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(log_level));

    // No SA_RESTART, so a signal interrupts accept()
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    int listen_fd = -1;
    try {
        listen_fd = listen_unix(listen_path);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::info("listening on unix:{}", listen_path);

    while (g_running) {
        int conn = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (conn < 0) {
            if (errno == EINTR) continue;
            spdlog::error("accept: {}", strerror(errno));
            break;
        }
        spdlog::info("bridge connected");
        try {
            mcpbridge::serve_backend_connection(conn, handle);
            spdlog::info("bridge disconnected");
        } catch (const mcpbridge::McpBackendError& e) {
            spdlog::warn("connection dropped: {}", e.what());
        }
        ::close(conn);
    }

    ::close(listen_fd);
    ::unlink(listen_path.c_str());
    return 0;
}
