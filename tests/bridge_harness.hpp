#pragma once
#include "mcpbridge/bridge.hpp"
#include "mcpbridge/transport/stdio_transport.hpp"
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpbridge::fake {

/// Runs Bridge::serve with `input` on a pipe and stdout redirected to an
/// unlinked temporary file. Returns the raw output lines.
inline std::vector<std::string> run_lines(Bridge& bridge, const std::string& input,
                                          StdioTransport::Options opts = {}) {
    int in[2];
    if (::pipe(in) < 0) throw std::runtime_error("pipe failed");
    FILE* out = std::tmpfile();
    if (!out) throw std::runtime_error("tmpfile failed");
    int out_fd = fileno(out);

    std::string error;
    {
        StdioTransport transport(in[0], out_fd, opts);
        // Input fits in the pipe buffer for every test that uses this.
        if (::write(in[1], input.data(), input.size()) != static_cast<ssize_t>(input.size())) {
            throw std::runtime_error("short write to input pipe");
        }
        ::close(in[1]);
        try {
            bridge.serve(transport);
        } catch (const std::exception& e) {
            error = e.what();
        }
    }
    ::close(in[0]);

    std::string data;
    ::lseek(out_fd, 0, SEEK_SET);
    char buf[4096];
    ssize_t n;
    while ((n = ::read(out_fd, buf, sizeof(buf))) > 0) {
        data.append(buf, static_cast<size_t>(n));
    }
    std::fclose(out);

    if (!error.empty()) throw std::runtime_error(error);

    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < data.size()) {
        auto nl = data.find('\n', pos);
        if (nl == std::string::npos) throw std::runtime_error("unterminated output line");
        lines.push_back(data.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

/// run_lines() with every output line parsed as JSON.
inline std::vector<nlohmann::json> run(Bridge& bridge, const std::string& input) {
    std::vector<nlohmann::json> out;
    for (const auto& line : run_lines(bridge, input)) {
        out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

} // namespace mcpbridge::fake
