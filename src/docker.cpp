/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/docker.hpp"
#include "swarmcron/logger.hpp"

#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

namespace swarmcron {

using json = nlohmann::json;

namespace {

constexpr const char* kDockerHub = "https://index.docker.io/v1/";

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::size_t appendBody(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlPtr newHandle() {
    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw OrchestratorError("cannot create curl handle");
    }
    return curl;
}

std::string escape(const std::string& value) {
    CurlPtr curl = newHandle();
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw OrchestratorError("cannot escape '" + value + "'");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

HeaderList buildHeaders(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& header : headers) {
        curl_slist* next = curl_slist_append(list, header.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw OrchestratorError("cannot build request headers");
        }
        list = next;
    }
    return HeaderList(list, &curl_slist_free_all);
}

// Engine errors come back as {"message": "..."}
std::string errorMessage(long status, const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            return j["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // plain text body
    }
    return body.empty() ? "HTTP status " + std::to_string(status) : body;
}

std::string stringAt(const json& j, const char* pointer) {
    return j.value(json::json_pointer(pointer), std::string());
}

constexpr char kBase64Url[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64UrlEncode(const std::string& in) {
    std::string out;
    out.reserve((in.size() + 2) / 3 * 4);
    std::size_t i = 0;
    while (i + 2 < in.size()) {
        std::uint32_t n = (static_cast<unsigned char>(in[i]) << 16) |
                          (static_cast<unsigned char>(in[i + 1]) << 8) |
                          static_cast<unsigned char>(in[i + 2]);
        out.push_back(kBase64Url[(n >> 18) & 63]);
        out.push_back(kBase64Url[(n >> 12) & 63]);
        out.push_back(kBase64Url[(n >> 6) & 63]);
        out.push_back(kBase64Url[n & 63]);
        i += 3;
    }
    if (i + 1 == in.size()) {
        std::uint32_t n = static_cast<unsigned char>(in[i]) << 16;
        out.push_back(kBase64Url[(n >> 18) & 63]);
        out.push_back(kBase64Url[(n >> 12) & 63]);
        out.append("==");
    } else if (i + 2 == in.size()) {
        std::uint32_t n = (static_cast<unsigned char>(in[i]) << 16) |
                          (static_cast<unsigned char>(in[i + 1]) << 8);
        out.push_back(kBase64Url[(n >> 18) & 63]);
        out.push_back(kBase64Url[(n >> 12) & 63]);
        out.push_back(kBase64Url[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

int base64Value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

std::optional<std::string> base64Decode(const std::string& in) {
    std::string out;
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : in) {
        if (c == '=') {
            break;
        }
        int v = base64Value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

// Events arrive as newline-delimited JSON on a request that never ends.
// A dedicated thread runs the transfer and queues decoded messages.
class DockerEventStream final : public EventStream {
public:
    explicit DockerEventStream(CurlPtr curl) : curl_(std::move(curl)) {
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, &DockerEventStream::onData);
        curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl_.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_.get(), CURLOPT_XFERINFOFUNCTION, &DockerEventStream::onProgress);
        curl_easy_setopt(curl_.get(), CURLOPT_XFERINFODATA, this);
        thread_ = std::thread(&DockerEventStream::pump, this);
    }

    ~DockerEventStream() override {
        close();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    StreamItem next() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !items_.empty(); });
        StreamItem item = items_.front();
        // The error item stays queued: the stream is finished
        if (item.kind == StreamItem::Kind::Message) {
            items_.pop_front();
        }
        return item;
    }

    void close() noexcept override {
        closed_.store(true);
    }

private:
    static std::size_t onData(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
        auto* self = static_cast<DockerEventStream*>(userdata);
        if (self->closed_.load()) {
            return 0;
        }

        long status = 0;
        curl_easy_getinfo(self->curl_.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            self->errorBody_.append(ptr, size * nmemb);
            return size * nmemb;
        }

        self->buffer_.append(ptr, size * nmemb);
        std::size_t newline;
        while ((newline = self->buffer_.find('\n')) != std::string::npos) {
            std::string line = self->buffer_.substr(0, newline);
            self->buffer_.erase(0, newline + 1);
            if (!line.empty()) {
                self->deliver(line);
            }
        }
        return size * nmemb;
    }

    static int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<DockerEventStream*>(userdata);
        return self->closed_.load() ? 1 : 0;
    }

    void deliver(const std::string& line) {
        StreamItem item;
        try {
            item.message = parseEventJson(json::parse(line));
        } catch (const json::exception& e) {
            LOG_WARN("Cannot decode event: " + std::string(e.what()));
            return;
        }
        push(std::move(item));
    }

    void push(StreamItem item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_all();
    }

    void pump() {
        setThreadName("Events");
        CURLcode rc = curl_easy_perform(curl_.get());

        StreamItem item;
        item.kind = StreamItem::Kind::Error;
        long status = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &status);
        if (closed_.load()) {
            item.error = "event stream closed";
        } else if (status >= 400) {
            item.error = errorMessage(status, errorBody_);
        } else if (rc != CURLE_OK) {
            item.error = curl_easy_strerror(rc);
        } else {
            item.error = "event stream ended";
        }
        push(std::move(item));
    }

    CurlPtr curl_;
    std::string buffer_;
    std::string errorBody_;

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<StreamItem> items_;
    std::atomic<bool> closed_{false};
    std::thread thread_;
};

}

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw OrchestratorError(std::string("cannot initialize libcurl: ") + curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

ServiceInfo parseServiceJson(const json& j) {
    ServiceInfo info;
    info.id = j.at("ID").get<std::string>();
    info.version = j.value(json::json_pointer("/Version/Index"), std::uint64_t{0});

    const json& spec = j.at("Spec");
    info.name = spec.value("Name", std::string());
    info.image = stringAt(spec, "/TaskTemplate/ContainerSpec/Image");

    if (spec.contains("Labels") && spec["Labels"].is_object()) {
        for (const auto& item : spec["Labels"].items()) {
            info.labels[item.key()] = item.value().get<std::string>();
        }
    }

    if (spec.contains("Mode") && spec["Mode"].is_object()) {
        const json& mode = spec["Mode"];
        if (mode.contains("Global")) {
            info.mode = ServiceMode::Global;
        } else if (mode.contains("Replicated")) {
            info.mode = ServiceMode::Replicated;
            info.replicas = mode["Replicated"].value("Replicas", std::uint64_t{0});
        }
    }
    return info;
}

TaskInfo parseTaskJson(const json& j) {
    TaskInfo task;
    task.id = j.at("ID").get<std::string>();
    task.serviceId = j.value("ServiceID", std::string());
    task.state = parseTaskState(stringAt(j, "/Status/State"));
    task.desiredState = parseTaskState(j.value("DesiredState", std::string()));
    task.message = stringAt(j, "/Status/Message");
    task.error = stringAt(j, "/Status/Err");
    return task;
}

EventMessage parseEventJson(const json& j) {
    EventMessage event;
    event.type = j.value("Type", std::string());
    event.action = j.value("Action", std::string());
    if (j.contains("Actor") && j["Actor"].is_object()) {
        const json& actor = j["Actor"];
        event.actorId = actor.value("ID", std::string());
        if (actor.contains("Attributes") && actor["Attributes"].is_object()) {
            for (const auto& item : actor["Attributes"].items()) {
                event.attributes[item.key()] =
                    item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
            }
        }
    }
    return event;
}

std::string decodeLogStream(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < 8) {
            return raw;
        }
        auto byte = [&raw](std::size_t i) { return static_cast<unsigned char>(raw[i]); };
        if (byte(pos) > 2 || byte(pos + 1) != 0 || byte(pos + 2) != 0 || byte(pos + 3) != 0) {
            return raw;
        }
        std::uint32_t size = (static_cast<std::uint32_t>(byte(pos + 4)) << 24) |
                             (static_cast<std::uint32_t>(byte(pos + 5)) << 16) |
                             (static_cast<std::uint32_t>(byte(pos + 6)) << 8) |
                             static_cast<std::uint32_t>(byte(pos + 7));
        pos += 8;
        if (raw.size() - pos < size) {
            return raw;
        }
        out.append(raw, pos, size);
        pos += size;
    }
    return out;
}

std::string normalizeImage(const std::string& image) {
    auto at = image.find("@sha256:");
    if (at != std::string::npos && at > 0) {
        return image.substr(0, at);
    }
    return image;
}

std::string registryHost(const std::string& image) {
    const std::string name = normalizeImage(image);
    auto slash = name.find('/');
    if (slash == std::string::npos) {
        return kDockerHub;
    }
    const std::string first = name.substr(0, slash);
    if (first.find('.') == std::string::npos && first.find(':') == std::string::npos && first != "localhost") {
        return kDockerHub;
    }
    if (first == "docker.io" || first == "index.docker.io" || first == "registry-1.docker.io") {
        return kDockerHub;
    }
    return first;
}

std::optional<std::string> encodeRegistryAuth(const json& dockerConfig, const std::string& image) {
    if (!dockerConfig.is_object() || !dockerConfig.contains("auths") || !dockerConfig["auths"].is_object()) {
        return std::nullopt;
    }
    const json& auths = dockerConfig["auths"];
    const std::string host = registryHost(image);

    const json* entry = nullptr;
    for (const auto& key : {host, "https://" + host, "http://" + host}) {
        auto it = auths.find(key);
        if (it != auths.end() && it->is_object()) {
            entry = &*it;
            break;
        }
    }
    if (!entry) {
        return std::nullopt;
    }

    json auth = json::object();
    const std::string identityToken = entry->value("identitytoken", std::string());
    const std::string inlineAuth = entry->value("auth", std::string());
    if (!identityToken.empty()) {
        auth["identitytoken"] = identityToken;
    } else if (!inlineAuth.empty()) {
        auto decoded = base64Decode(inlineAuth);
        if (!decoded) {
            return std::nullopt;
        }
        auto colon = decoded->find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        auth["username"] = decoded->substr(0, colon);
        auth["password"] = decoded->substr(colon + 1);
    } else if (entry->contains("username") && entry->contains("password")) {
        auth["username"] = entry->value("username", std::string());
        auth["password"] = entry->value("password", std::string());
    } else {
        return std::nullopt;
    }
    auth["serveraddress"] = host;
    return base64UrlEncode(auth.dump());
}

DockerClient::DockerClient(const std::string& host, std::string apiVersion) : apiVersion_(std::move(apiVersion)) {
    if (startsWith(host, "unix://")) {
        socketPath_ = host.substr(7);
        baseUrl_ = "http://localhost";
    } else if (startsWith(host, "tcp://")) {
        baseUrl_ = "http://" + host.substr(6);
    } else if (startsWith(host, "http://") || startsWith(host, "https://")) {
        baseUrl_ = host;
    } else {
        throw OrchestratorError("unsupported docker host " + host);
    }
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
    LOG_DEBUG("Docker client for " + host + " (API " + (apiVersion_.empty() ? "default" : apiVersion_) + ")");
}

void DockerClient::ping() {
    Response response = request("GET", "/_ping");
    LOG_DEBUG("Docker daemon answered ping: " + response.body);
}

std::vector<ServiceInfo> DockerClient::listServices(const std::vector<std::string>& labelKeys) {
    json filters = json::object();
    if (!labelKeys.empty()) {
        filters["label"] = labelKeys;
    }
    json services = requestJson("GET", "/services?filters=" + escape(filters.dump()));

    std::vector<ServiceInfo> out;
    try {
        for (const auto& service : services) {
            out.push_back(parseServiceJson(service));
        }
    } catch (const json::exception& e) {
        throw OrchestratorError("invalid service list: " + std::string(e.what()));
    }
    return out;
}

ServiceInfo DockerClient::inspectService(const std::string& name) {
    json service = requestJson("GET", "/services/" + escape(name));
    try {
        return parseServiceJson(service);
    } catch (const json::exception& e) {
        throw OrchestratorError("invalid service " + name + ": " + std::string(e.what()));
    }
}

std::vector<TaskInfo> DockerClient::listTasks(const std::string& service) {
    json filters = json::object();
    filters["service"] = json::array({service});
    json tasks = requestJson("GET", "/tasks?filters=" + escape(filters.dump()));

    std::vector<TaskInfo> out;
    try {
        for (const auto& task : tasks) {
            out.push_back(parseTaskJson(task));
        }
    } catch (const json::exception& e) {
        throw OrchestratorError("invalid task list of " + service + ": " + std::string(e.what()));
    }
    return out;
}

std::string DockerClient::taskLogs(const std::string& taskId) {
    Response response = request("GET", "/tasks/" + escape(taskId) + "/logs?stdout=1&stderr=1&details=1");
    return decodeLogStream(response.body);
}

void DockerClient::updateService(const ServiceUpdate& update) {
    json service = requestJson("GET", "/services/" + escape(update.service));

    std::string id;
    std::uint64_t version = 0;
    json spec;
    try {
        id = service.at("ID").get<std::string>();
        version = service.at("Version").at("Index").get<std::uint64_t>();
        spec = service.at("Spec");

        if (update.replicas && spec.contains("Mode") && spec["Mode"].contains("Replicated")) {
            spec["Mode"]["Replicated"]["Replicas"] = *update.replicas;
        }
        if (update.forceUpdate) {
            json& taskTemplate = spec["TaskTemplate"];
            taskTemplate["ForceUpdate"] = taskTemplate.value("ForceUpdate", std::uint64_t{0}) + 1;
        }
        for (const auto& [key, value] : update.labels) {
            if (value) {
                spec["Labels"][key] = *value;
            } else if (spec.contains("Labels") && spec["Labels"].is_object()) {
                spec["Labels"].erase(key);
            }
        }
    } catch (const json::exception& e) {
        throw OrchestratorError("invalid service " + update.service + ": " + std::string(e.what()));
    }

    std::vector<std::string> headers{"Content-Type: application/json"};
    if (update.registryAuth) {
        const std::string image = normalizeImage(stringAt(spec, "/TaskTemplate/ContainerSpec/Image"));
        const std::string auth = registryAuthFor(image);
        if (!auth.empty()) {
            headers.push_back("X-Registry-Auth: " + auth);
        }
    }

    json result = requestJson("POST", "/services/" + escape(id) + "/update?version=" + std::to_string(version),
                              spec.dump(), headers);
    if (result.is_object() && result.contains("Warnings") && result["Warnings"].is_array()) {
        for (const auto& warning : result["Warnings"]) {
            if (warning.is_string()) {
                LOG_WARN("Update of " + update.service + ": " + warning.get<std::string>());
            }
        }
    }
}

std::unique_ptr<EventStream> DockerClient::events(const std::string& type) {
    json filters = json::object();
    filters["type"] = json::array({type});
    const std::string target = url("/events?filters=" + escape(filters.dump()));

    CurlPtr curl = newHandle();
    curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (!socketPath_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socketPath_.c_str());
    }
    return std::make_unique<DockerEventStream>(std::move(curl));
}

DockerClient::Response DockerClient::request(const std::string& method, const std::string& path,
                                             const std::string& body,
                                             const std::vector<std::string>& headers) const {
    CurlPtr curl = newHandle();
    Response response;
    const std::string target = url(path);

    curl_easy_setopt(curl.get(), CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    if (!socketPath_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socketPath_.c_str());
    }
    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    HeaderList list = buildHeaders(headers);
    if (list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    LOG_TRACE(method + " " + target);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw OrchestratorError(method + " " + path + ": " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status >= 400) {
        throw OrchestratorError(errorMessage(response.status, response.body), static_cast<int>(response.status));
    }
    return response;
}

json DockerClient::requestJson(const std::string& method, const std::string& path,
                               const std::string& body, const std::vector<std::string>& headers) const {
    Response response = request(method, path, body, headers);
    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw OrchestratorError("invalid response to " + method + " " + path + ": " + std::string(e.what()));
    }
}

std::string DockerClient::url(const std::string& path) const {
    if (apiVersion_.empty()) {
        return baseUrl_ + path;
    }
    return baseUrl_ + "/v" + apiVersion_ + path;
}

std::string DockerClient::registryAuthFor(const std::string& image) const {
    std::filesystem::path configPath;
    const char* configDir = std::getenv("DOCKER_CONFIG");
    const char* home = std::getenv("HOME");
    if (configDir && *configDir) {
        configPath = std::filesystem::path(configDir) / "config.json";
    } else if (home && *home) {
        configPath = std::filesystem::path(home) / ".docker" / "config.json";
    } else {
        LOG_WARN("Cannot locate docker config for registry auth");
        return "";
    }

    std::ifstream in(configPath);
    if (!in) {
        LOG_WARN("Cannot read docker config " + configPath.string());
        return "";
    }

    json config;
    try {
        in >> config;
    } catch (const json::exception& e) {
        LOG_WARN("Cannot parse docker config " + configPath.string() + ": " + std::string(e.what()));
        return "";
    }

    auto auth = encodeRegistryAuth(config, image);
    if (!auth) {
        LOG_WARN("No credentials for registry " + registryHost(image) + " in " + configPath.string());
        return "";
    }
    LOG_DEBUG("Using registry auth for " + image);
    return *auth;
}

}
