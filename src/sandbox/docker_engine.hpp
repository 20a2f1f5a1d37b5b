#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/beast/http/verb.hpp>

#include "config/config_schema.hpp"
#include "sandbox/container_engine.hpp"

namespace stockade::sandbox {

// ContainerEngine backed by the Docker Engine HTTP API, reached over a local
// socket (unix:///var/run/docker.sock) or plain TCP (tcp://host:port).
// Every request carries a deadline; a request that runs past it fails with
// an EngineError whose IsTimeout() is true.
// Log and exec output past engine.maxResponseMb is dropped and the result is
// flagged as truncated.
class DockerEngine : public ContainerEngine {
public:
    explicit DockerEngine(const config::EngineConfig& config);

    bool ImageExists(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void StartContainer(const std::string& id) override;
    std::optional<int> WaitContainer(const std::string& id, std::chrono::milliseconds timeout) override;
    void KillContainer(const std::string& id) override;
    ContainerLogs GetLogs(const std::string& id) override;
    void RemoveContainer(const std::string& id) override;
    ExecOutput Exec(const std::string& id,
                    const std::vector<std::string>& argv,
                    const std::map<std::string, std::string>& env,
                    const std::string& workdir,
                    std::chrono::milliseconds timeout) override;
    std::string GetArchive(const std::string& id, const std::string& path) override;
    void PutArchive(const std::string& id, const std::string& dir, const std::string& archive) override;

private:
    struct Response {
        unsigned status = 0;
        std::string body;
        bool truncated = false;
    };

    enum class Method {
        kGet,
        kPost,
        kPut,
        kDelete
    };

    static boost::beast::http::verb ToVerb(Method method);

    Response Request(Method method,
                     const std::string& path,
                     const std::string& body = {},
                     const std::string& content_type = "application/json",
                     std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    // Request() that throws EngineError for any status >= 400.
    Response Checked(Method method,
                     const std::string& path,
                     const std::string& body = {},
                     const std::string& content_type = "application/json",
                     std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    std::string api_prefix_;
    bool use_unix_socket_ = true;
    std::string socket_path_;
    std::string tcp_host_;
    std::string tcp_port_;
    std::chrono::milliseconds request_timeout_;
    std::uint64_t max_response_bytes_;
};

// Splits the engine's multiplexed stdout/stderr stream (8-byte frame headers).
// Input without frame headers is returned as stdout; a truncated final frame
// keeps whatever bytes arrived.
ContainerLogs DemuxLogStream(std::string_view raw);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string UrlEncode(const std::string& value);

}  // namespace stockade::sandbox
