//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProxyConfig.cpp
// Purpose: Command-line parsing and validation for mcp-proxy
//==========================================================================================================

#include <optional>
#include <sstream>

#include "mcpproxy/ProxyConfig.h"
#include "mcpproxy/errors/Errors.h"

namespace mcpproxy {

namespace {

// Flags that take a value, with their short aliases.
struct ValueFlag {
    const char* shortName;
    const char* longName;
};

constexpr ValueFlag kUrl{"-u", "--url"};
constexpr ValueFlag kTimeout{"-t", "--timeout"};
constexpr ValueFlag kCaFile{"", "--ca-file"};
constexpr ValueFlag kCommand{"-c", "--command"};
constexpr ValueFlag kArgs{"-a", "--args"};
constexpr ValueFlag kPipe{"-p", "--pipe"};

bool matches(const ValueFlag& f, const std::string& key) {
    return key == f.longName || (*f.shortName != '\0' && key == f.shortName);
}

unsigned int parseTimeout(const std::string& v) {
    std::size_t used = 0;
    unsigned long secs = 0;
    try {
        secs = std::stoul(v, &used);
    } catch (const std::exception&) {
        throw errors::ConfigError("Invalid --timeout value '" + v + "' (expected seconds)");
    }
    if (used != v.size() || secs == 0 || secs > 86400 || v.front() == '-') {
        throw errors::ConfigError("Invalid --timeout value '" + v + "' (expected 1..86400 seconds)");
    }
    return static_cast<unsigned int>(secs);
}

} // namespace

std::vector<std::string> SplitArgs(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string word;
    while (iss >> word) {
        out.push_back(word);
    }
    return out;
}

ProxyConfig ParseProxyArgs(int argc, const char* const* argv) {
    ProxyConfig cfg;
    std::optional<std::string> url;
    std::optional<std::string> command;
    std::optional<std::string> args;
    std::optional<std::string> pipe;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        std::string key = a;
        std::optional<std::string> inlineValue;
        if (a.rfind("--", 0) == 0) {
            auto eq = a.find('=');
            if (eq != std::string::npos) {
                key = a.substr(0, eq);
                inlineValue = a.substr(eq + 1);
            }
        }

        if (key == "-h" || key == "--help") {
            cfg.showHelp = true;
            continue;
        }
        if (key == "-V" || key == "--version") {
            cfg.showVersion = true;
            continue;
        }
        if (key == "-v" || key == "--verbose") {
            cfg.verbose = true;
            continue;
        }

        const ValueFlag* flag = nullptr;
        for (const ValueFlag* f : {&kUrl, &kTimeout, &kCaFile, &kCommand, &kArgs, &kPipe}) {
            if (matches(*f, key)) {
                flag = f;
                break;
            }
        }
        if (!flag) {
            throw errors::ConfigError("Unknown option: " + a);
        }

        std::string value;
        if (inlineValue.has_value()) {
            value = *inlineValue;
        } else {
            if (i + 1 >= argc) {
                throw errors::ConfigError(std::string("Missing value for ") + flag->longName);
            }
            value = argv[++i];
        }

        if (flag == &kUrl) {
            url = value;
        } else if (flag == &kTimeout) {
            cfg.timeoutSeconds = parseTimeout(value);
        } else if (flag == &kCaFile) {
            cfg.caFile = value;
        } else if (flag == &kCommand) {
            command = value;
        } else if (flag == &kArgs) {
            args = value;
        } else if (flag == &kPipe) {
            pipe = value;
        }
    }

    if (cfg.showHelp || cfg.showVersion) {
        return cfg;
    }

    const int selected = (url.has_value() ? 1 : 0) + (command.has_value() ? 1 : 0) + (pipe.has_value() ? 1 : 0);
    if (selected == 0) {
        throw errors::ConfigError("No target selected: pass one of --url, --command or --pipe");
    }
    if (selected > 1) {
        throw errors::ConfigError("Targets are mutually exclusive: pass only one of --url, --command or --pipe");
    }
    if (args.has_value() && !command.has_value()) {
        throw errors::ConfigError("--args requires --command");
    }

    if (url.has_value()) {
        if (url->empty()) {
            throw errors::ConfigError("--url must not be empty");
        }
        cfg.target = TargetKind::Http;
        cfg.url = *url;
    } else if (command.has_value()) {
        if (command->empty()) {
            throw errors::ConfigError("--command must not be empty");
        }
        cfg.target = TargetKind::Process;
        cfg.command = *command;
        if (args.has_value()) {
            cfg.commandArgs = SplitArgs(*args);
        }
    } else {
        if (pipe->empty()) {
            throw errors::ConfigError("--pipe must not be empty");
        }
        cfg.target = TargetKind::Socket;
        cfg.socketPath = *pipe;
    }
    return cfg;
}

std::string ProxyUsage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " (--url <url> | --command <cmd> [--args \"<args>\"] | --pipe <path>) [options]\n"
        << "\n"
        << "Reads MCP JSON-RPC requests from stdin, one per line, forwards tools/list and tools/call to the\n"
        << "selected backend and writes one JSON-RPC response per request to stdout.\n"
        << "\n"
        << "Targets (exactly one):\n"
        << "  -u, --url <url>         HTTP(S) MCP endpoint\n"
        << "  -c, --command <cmd>     Spawn a stdio MCP server\n"
        << "  -a, --args \"<args>\"     Whitespace-separated arguments for --command\n"
        << "  -p, --pipe <path>       Unix domain socket (or FIFO) of an MCP server\n"
        << "\n"
        << "Options:\n"
        << "  -t, --timeout <secs>    HTTP timeout in seconds (default 30)\n"
        << "      --ca-file <path>    PEM CA bundle for https (default: system trust store)\n"
        << "  -v, --verbose           Debug diagnostics on stderr\n"
        << "  -V, --version           Print version and exit\n"
        << "  -h, --help              Print this help and exit\n"
        << "\n"
        << "Environment:\n"
        << "  MCPPROXY_LOG_LEVEL      DEBUG|INFO|WARN|ERROR|FATAL (overrides --verbose)\n"
        << "  MCPPROXY_LOG_FILE       Also append diagnostics to this file\n"
        << "  MCPPROXY_LOG_COLOR      1/0 to force colored level labels on or off\n";
    return oss.str();
}

} // namespace mcpproxy
