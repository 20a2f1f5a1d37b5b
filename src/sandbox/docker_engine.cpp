#include "sandbox/docker_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "nlohmann/json.hpp"
#include "sandbox/errors.hpp"
#include "utils/logging.hpp"

namespace stockade::sandbox {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

constexpr const char* kTag = "engine";
constexpr int kExitPollAttempts = 20;
constexpr std::chrono::milliseconds kExitPollInterval{50};

// One request/response round trip driven on a private io_context so the
// stream's deadline bounds connect, write and read together.
struct Exchange {
    http::request<http::string_body> request;
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    beast::error_code ec;
};

template <class Stream>
void WriteThenRead(Stream& stream, Exchange& exchange) {
    http::async_write(stream, exchange.request,
        [&stream, &exchange](beast::error_code ec, std::size_t) {
            if (ec) {
                exchange.ec = ec;
                return;
            }
            http::async_read(stream, exchange.buffer, exchange.parser,
                [&exchange](beast::error_code read_ec, std::size_t) {
                    exchange.ec = read_ec;
                });
        });
}

std::string ErrorMessage(const std::string& body, unsigned status) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("message") && json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    return "HTTP " + std::to_string(status);
}

nlohmann::json ParseJsonBody(const std::string& body, const std::string& what) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw EngineError("invalid JSON in " + what + " response");
    }
    return json;
}

nlohmann::json EnvList(const std::map<std::string, std::string>& env) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [key, value] : env) {
        list.push_back(key + "=" + value);
    }
    return list;
}

std::uint32_t ReadBigEndian32(const unsigned char* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
        (static_cast<std::uint32_t>(data[1]) << 16) |
        (static_cast<std::uint32_t>(data[2]) << 8) |
        static_cast<std::uint32_t>(data[3]);
}

}  // namespace

DockerEngine::DockerEngine(const config::EngineConfig& config)
    : api_prefix_(config.api_version.empty() ? std::string() : "/" + config.api_version)
    , request_timeout_(std::chrono::seconds(config.request_timeout_s))
    , max_response_bytes_(static_cast<std::uint64_t>(config.max_response_mb) * 1024 * 1024) {
    const std::string& host = config.host;
    if (host.rfind("unix://", 0) == 0) {
        use_unix_socket_ = true;
        socket_path_ = host.substr(7);
    } else if (host.rfind("tcp://", 0) == 0 || host.rfind("http://", 0) == 0) {
        use_unix_socket_ = false;
        auto host_port = host.substr(host.find("://") + 3);
        const auto slash = host_port.find('/');
        if (slash != std::string::npos) {
            host_port = host_port.substr(0, slash);
        }
        const auto colon = host_port.rfind(':');
        tcp_host_ = colon == std::string::npos ? host_port : host_port.substr(0, colon);
        tcp_port_ = colon == std::string::npos ? "2375" : host_port.substr(colon + 1);
    } else {
        throw EngineError("unsupported engine host '" + host + "'");
    }
    if ((use_unix_socket_ && socket_path_.empty()) || (!use_unix_socket_ && tcp_host_.empty())) {
        throw EngineError("invalid engine host '" + host + "'");
    }
}

DockerEngine::Response DockerEngine::Request(Method method,
                                             const std::string& path,
                                             const std::string& body,
                                             const std::string& content_type,
                                             std::chrono::milliseconds timeout) {
    if (timeout <= std::chrono::milliseconds::zero()) {
        timeout = request_timeout_;
    }

    Exchange exchange;
    exchange.request.method(ToVerb(method));
    exchange.request.target(api_prefix_ + path);
    exchange.request.version(11);
    exchange.request.set(http::field::host, use_unix_socket_ ? std::string("docker") : tcp_host_);
    exchange.request.set(http::field::user_agent, "stockade");
    exchange.request.keep_alive(false);
    if (!body.empty() || method == Method::kPost || method == Method::kPut) {
        exchange.request.set(http::field::content_type, content_type);
        exchange.request.body() = body;
        exchange.request.prepare_payload();
    }
    exchange.parser.body_limit(max_response_bytes_);

    net::io_context ioc;
    if (use_unix_socket_) {
        beast::basic_stream<net::local::stream_protocol> stream(ioc);
        stream.expires_after(timeout);
        stream.async_connect(net::local::stream_protocol::endpoint(socket_path_),
            [&stream, &exchange](beast::error_code ec) {
                if (ec) {
                    exchange.ec = ec;
                    return;
                }
                WriteThenRead(stream, exchange);
            });
        ioc.run();
    } else {
        net::ip::tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);
        resolver.async_resolve(tcp_host_, tcp_port_,
            [&stream, &exchange](beast::error_code ec, net::ip::tcp::resolver::results_type results) {
                if (ec) {
                    exchange.ec = ec;
                    return;
                }
                stream.async_connect(results,
                    [&stream, &exchange](beast::error_code connect_ec, net::ip::tcp::endpoint) {
                        if (connect_ec) {
                            exchange.ec = connect_ec;
                            return;
                        }
                        WriteThenRead(stream, exchange);
                    });
            });
        ioc.run();
    }

    if (exchange.ec == beast::error::timeout) {
        throw EngineError(path + " timed out", 0, true);
    }
    // Over the cap: keep the status and whatever body arrived, drop the rest.
    const bool truncated = exchange.ec == http::error::body_limit && exchange.parser.is_header_done();
    if (exchange.ec && !truncated) {
        throw EngineError(path + ": " + exchange.ec.message());
    }
    if (truncated) {
        utils::LogWarn(kTag, path + ": response exceeds " + std::to_string(max_response_bytes_) +
            " bytes, truncated");
    }

    auto message = exchange.parser.release();
    return Response{message.result_int(), std::move(message.body()), truncated};
}

http::verb DockerEngine::ToVerb(Method method) {
    switch (method) {
        case Method::kGet: return http::verb::get;
        case Method::kPost: return http::verb::post;
        case Method::kPut: return http::verb::put;
        case Method::kDelete: return http::verb::delete_;
    }
    throw EngineError("unknown request method");
}

DockerEngine::Response DockerEngine::Checked(Method method,
                                             const std::string& path,
                                             const std::string& body,
                                             const std::string& content_type,
                                             std::chrono::milliseconds timeout) {
    auto response = Request(method, path, body, content_type, timeout);
    if (response.status >= 400) {
        throw EngineError(ErrorMessage(response.body, response.status), static_cast<int>(response.status));
    }
    return response;
}

bool DockerEngine::ImageExists(const std::string& image) {
    const auto response = Request(Method::kGet, "/images/" + image + "/json");
    if (response.status == 200) {
        return true;
    }
    if (response.status == 404) {
        return false;
    }
    throw EngineError(ErrorMessage(response.body, response.status), static_cast<int>(response.status));
}

std::string DockerEngine::CreateContainer(const ContainerSpec& spec) {
    const auto& runtime = spec.runtime;
    nlohmann::json host_config = {
        {"NetworkMode", runtime.network_mode},
        {"Memory", runtime.memory_bytes},
        {"NanoCpus", runtime.nano_cpus},
        {"PidsLimit", runtime.pids_limit},
        {"CapDrop", runtime.cap_drop},
        {"SecurityOpt", runtime.security_opt},
        {"ReadonlyRootfs", runtime.read_only_rootfs},
        {"AutoRemove", false}
    };
    if (!runtime.tmpfs.empty()) {
        host_config["Tmpfs"] = runtime.tmpfs;
    }
    if (!spec.binds.empty()) {
        nlohmann::json binds = nlohmann::json::array();
        for (const auto& bind : spec.binds) {
            binds.push_back(bind.source + ":" + bind.target + (bind.read_only ? ":ro" : ":rw"));
        }
        host_config["Binds"] = binds;
    }

    nlohmann::json payload = {
        {"Image", spec.image},
        {"Env", EnvList(spec.env)},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"NetworkDisabled", runtime.network_mode == "none"},
        {"HostConfig", host_config}
    };
    if (!spec.command.empty()) {
        payload["Cmd"] = spec.command;
    }
    if (!runtime.user.empty()) {
        payload["User"] = runtime.user;
    }

    const auto response = Checked(Method::kPost, "/containers/create", payload.dump());
    const auto json = ParseJsonBody(response.body, "create");
    if (json.contains("Warnings") && json["Warnings"].is_array()) {
        for (const auto& warning : json["Warnings"]) {
            if (warning.is_string()) {
                utils::LogWarn(kTag, "create: " + warning.get<std::string>());
            }
        }
    }
    const auto id = json.value("Id", std::string());
    if (id.empty()) {
        throw EngineError("create response has no container id");
    }
    return id;
}

void DockerEngine::StartContainer(const std::string& id) {
    // 304 means it was already running.
    Checked(Method::kPost, "/containers/" + id + "/start");
}

std::optional<int> DockerEngine::WaitContainer(const std::string& id, std::chrono::milliseconds timeout) {
    Response response{};
    try {
        response = Checked(Method::kPost, "/containers/" + id + "/wait?condition=not-running",
                           {}, "application/json", timeout);
    } catch (const EngineError& ex) {
        if (ex.IsTimeout()) {
            return std::nullopt;
        }
        throw;
    }
    const auto json = ParseJsonBody(response.body, "wait");
    if (json.contains("Error") && json["Error"].is_object() && json["Error"].contains("Message")) {
        const auto message = json["Error"].value("Message", std::string());
        if (!message.empty()) {
            throw EngineError("wait: " + message);
        }
    }
    if (!json.contains("StatusCode") || !json["StatusCode"].is_number_integer()) {
        throw EngineError("wait response has no StatusCode");
    }
    return json["StatusCode"].get<int>();
}

void DockerEngine::KillContainer(const std::string& id) {
    const auto response = Request(Method::kPost, "/containers/" + id + "/kill?signal=SIGKILL");
    // 409: no longer running, which is the state we wanted.
    if (response.status >= 400 && response.status != 409) {
        throw EngineError(ErrorMessage(response.body, response.status), static_cast<int>(response.status));
    }
}

ContainerLogs DockerEngine::GetLogs(const std::string& id) {
    const auto response = Checked(Method::kGet, "/containers/" + id + "/logs?stdout=1&stderr=1");
    auto logs = DemuxLogStream(response.body);
    logs.truncated = response.truncated;
    return logs;
}

void DockerEngine::RemoveContainer(const std::string& id) {
    Checked(Method::kDelete, "/containers/" + id + "?force=1&v=1");
}

ExecOutput DockerEngine::Exec(const std::string& id,
                              const std::vector<std::string>& argv,
                              const std::map<std::string, std::string>& env,
                              const std::string& workdir,
                              std::chrono::milliseconds timeout) {
    nlohmann::json create = {
        {"AttachStdin", false},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", argv},
        {"Env", EnvList(env)}
    };
    if (!workdir.empty()) {
        create["WorkingDir"] = workdir;
    }
    const auto created = Checked(Method::kPost, "/containers/" + id + "/exec", create.dump());
    const auto exec_id = ParseJsonBody(created.body, "exec create").value("Id", std::string());
    if (exec_id.empty()) {
        throw EngineError("exec create response has no id");
    }

    const nlohmann::json start = {{"Detach", false}, {"Tty", false}};
    const auto started = Checked(Method::kPost, "/exec/" + exec_id + "/start", start.dump(),
                                 "application/json", timeout);
    auto logs = DemuxLogStream(started.body);

    ExecOutput output{};
    output.stdout_text = std::move(logs.stdout_text);
    output.stderr_text = std::move(logs.stderr_text);
    output.truncated = started.truncated;

    // The stream closes when the process exits; the exit code can lag
    // behind by a few milliseconds. A truncated stream was closed by us, so
    // the process may still be running and is looked at only once.
    const int attempts = started.truncated ? 1 : kExitPollAttempts;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(kExitPollInterval);
        }
        const auto inspect = ParseJsonBody(Checked(Method::kGet, "/exec/" + exec_id + "/json").body, "exec inspect");
        const bool running = inspect.value("Running", false);
        if (!running && inspect.contains("ExitCode") && inspect["ExitCode"].is_number_integer()) {
            output.exit_code = inspect["ExitCode"].get<int>();
            return output;
        }
    }
    if (output.truncated) {
        output.exit_code = kAbnormalExit;
        return output;
    }
    throw EngineError("exec " + exec_id + " did not report an exit code");
}

std::string DockerEngine::GetArchive(const std::string& id, const std::string& path) {
    return Checked(Method::kGet, "/containers/" + id + "/archive?path=" + UrlEncode(path)).body;
}

void DockerEngine::PutArchive(const std::string& id, const std::string& dir, const std::string& archive) {
    Checked(Method::kPut, "/containers/" + id + "/archive?path=" + UrlEncode(dir), archive, "application/x-tar");
}

ContainerLogs DemuxLogStream(std::string_view raw) {
    ContainerLogs logs{};
    std::size_t offset = 0;
    while (offset < raw.size()) {
        const auto* header = reinterpret_cast<const unsigned char*>(raw.data() + offset);
        const bool framed = raw.size() - offset >= 8 && header[0] <= 2 &&
            header[1] == 0 && header[2] == 0 && header[3] == 0;
        if (!framed) {
            logs.stdout_text.append(raw.substr(offset));
            break;
        }
        const std::size_t length = ReadBigEndian32(header + 4);
        const std::size_t available = std::min(length, raw.size() - offset - 8);
        const auto payload = raw.substr(offset + 8, available);
        if (header[0] == 2) {
            logs.stderr_text.append(payload);
        } else {
            logs.stdout_text.append(payload);
        }
        offset += 8 + available;
    }
    return logs;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c);
        }
    }
    return encoded.str();
}

}  // namespace stockade::sandbox
