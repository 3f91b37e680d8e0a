#include "sandbox/docker_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <mutex>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;
using nlohmann::json;

static once_flag curl_init_flag;

docker_client::docker_client(const string &socket_path) : socket_path(socket_path) {
    call_once(curl_init_flag, [] {
        if (CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT); code != CURLE_OK)
            throw runtime_unavailable(string("unable to initialize libcurl: ") + curl_easy_strerror(code));
    });
}

namespace {

struct transfer_context {
    CURL *curl;
    string *body;
    const function<bool(const char *, size_t)> *sink;
    bool aborted = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *ctx = static_cast<transfer_context *>(userdata);
    size_t total = size * nmemb;
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    // 出错时 docker 返回的是 json 错误信息，不交给 sink 处理
    if (!ctx->sink || !*ctx->sink || status >= 400) {
        ctx->body->append(ptr, total);
        return total;
    }
    if (!(*ctx->sink)(ptr, total)) {
        ctx->aborted = true;
        return 0;  // 让 curl 中止传输
    }
    return total;
}

}  // namespace

docker_client::response docker_client::request(const string &method,
                                               const string &path,
                                               const optional<json> &body,
                                               chrono::milliseconds timeout,
                                               const function<bool(const char *, size_t)> &sink) const {
    CURL *curl = curl_easy_init();
    if (!curl) throw container_error("unable to create curl handle");
    defer { curl_easy_cleanup(curl); };

    response res;
    transfer_context ctx{curl, &res.body, &sink};
    string url = "http://localhost" + path;
    string payload = body ? body->dump() : "";
    char error_buffer[CURL_ERROR_SIZE] = {0};

    struct curl_slist *headers = nullptr;
    defer { curl_slist_free_all(headers); };
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    DLOG(INFO) << "docker " << method << " " << path;

    CURLcode code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);

    if (code == CURLE_OPERATION_TIMEDOUT) {
        res.timed_out = true;
        return res;
    }
    if (code == CURLE_WRITE_ERROR && ctx.aborted) {
        res.aborted = true;
        return res;
    }
    if (code != CURLE_OK) {
        throw container_error(fmt::format("{} {} failed: {}", method, path,
                                          error_buffer[0] ? error_buffer : curl_easy_strerror(code)));
    }
    return res;
}

void docker_client::expect_success(const response &res, const string &what) const {
    if (res.timed_out)
        throw container_error(what + ": request timed out");
    if (res.status >= 200 && res.status < 300) return;

    string message = res.body;
    try {
        json j = json::parse(res.body);
        if (j.is_object() && j.count("message")) message = j.at("message").get<string>();
    } catch (json::exception &) {
        // docker 返回的不是 json，保留原始内容
    }
    throw container_error(fmt::format("{}: HTTP {} {}", what, res.status, message));
}

void docker_client::ping() const {
    expect_success(request("GET", "/_ping", nullopt, chrono::seconds(10)), "ping docker daemon");
}

bool docker_client::image_exists(const string &image) const {
    response res = request("GET", "/images/" + image + "/json", nullopt, chrono::seconds(30));
    if (res.status == 404) return false;
    expect_success(res, "inspect image " + image);
    return true;
}

void docker_client::pull_image(const string &image) const {
    auto [repository, tag] = split_image_tag(image);
    string path = "/images/create?fromImage=" + url_escape(repository);
    if (!tag.empty()) path += "&tag=" + url_escape(tag);
    response res = request("POST", path, nullopt);
    expect_success(res, "pull image " + image);

    // 拉取进度以多行 json 的形式返回，即使 HTTP 状态码为 200 也可能包含错误
    istringstream lines(res.body);
    string line;
    while (getline(lines, line)) {
        if (line.empty()) continue;
        json progress = json::parse(line, nullptr, false);
        if (progress.is_object() && progress.count("error"))
            throw container_error("pull image " + image + ": " + progress.at("error").get<string>());
    }
}

string docker_client::create_container(const json &spec) const {
    response res = request("POST", "/containers/create", spec, chrono::seconds(30));
    expect_success(res, "create container");
    json j = json::parse(res.body);
    for (auto &warning : j.value("Warnings", json::array()))
        if (warning.is_string()) LOG(WARNING) << "docker: " << warning.get<string>();
    return j.at("Id").get<string>();
}

void docker_client::start_container(const string &id) const {
    response res = request("POST", "/containers/" + id + "/start", nullopt, chrono::seconds(30));
    if (res.status == 304) return;  // 已经启动
    expect_success(res, "start container " + id);
}

optional<int> docker_client::wait_container(const string &id, chrono::milliseconds timeout) const {
    response res = request("POST", "/containers/" + id + "/wait?condition=not-running", nullopt, timeout);
    if (res.timed_out) return nullopt;
    expect_success(res, "wait container " + id);

    json j = json::parse(res.body);
    if (j.contains("Error") && j.at("Error").is_object() && !j.at("Error").value("Message", "").empty())
        throw container_error("wait container " + id + ": " + j.at("Error").at("Message").get<string>());
    return j.at("StatusCode").get<int>();
}

void docker_client::kill_container(const string &id, const string &signal) const {
    response res = request("POST", "/containers/" + id + "/kill?signal=" + url_escape(signal), nullopt, chrono::seconds(10));
    if (res.status == 409 || res.status == 404) return;  // 容器已经停止或者已经被删除
    expect_success(res, "kill container " + id);
}

container_state docker_client::inspect_container(const string &id) const {
    response res = request("GET", "/containers/" + id + "/json", nullopt, chrono::seconds(10));
    expect_success(res, "inspect container " + id);
    json state = json::parse(res.body).at("State");

    container_state result;
    result.exit_code = state.value("ExitCode", -1);
    result.oom_killed = state.value("OOMKilled", false);
    result.running = state.value("Running", false);
    return result;
}

void docker_client::container_logs(const string &id, const function<bool(const char *, size_t)> &sink) const {
    response res = request("GET", "/containers/" + id + "/logs?stdout=1&stderr=1", nullopt, chrono::seconds(30), sink);
    if (res.aborted) return;
    expect_success(res, "read logs of container " + id);
}

void docker_client::remove_container(const string &id, bool force) const {
    response res = request("DELETE", "/containers/" + id + "?v=1&force=" + (force ? "1" : "0"), nullopt, chrono::seconds(30));
    if (res.status == 404) return;
    expect_success(res, "remove container " + id);
}

vector<string> docker_client::list_containers(const json &filters) const {
    response res = request("GET", "/containers/json?all=1&filters=" + url_escape(filters.dump()), nullopt, chrono::seconds(30));
    expect_success(res, "list containers");

    vector<string> ids;
    for (auto &container : json::parse(res.body))
        ids.push_back(container.at("Id").get<string>());
    return ids;
}

string url_escape(const string &text) {
    CURL *curl = curl_easy_init();
    if (!curl) throw container_error("unable to create curl handle");
    defer { curl_easy_cleanup(curl); };

    char *escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) throw container_error("unable to escape " + text);
    string result(escaped);
    curl_free(escaped);
    return result;
}

pair<string, string> split_image_tag(const string &image) {
    if (image.find('@') != string::npos)
        return {image, ""};  // 按摘要引用的镜像不带标签
    size_t colon = image.find_last_of(':');
    size_t slash = image.find_last_of('/');
    // 冒号出现在最后一个斜杠之前时是仓库地址的端口号，不是标签
    if (colon == string::npos || (slash != string::npos && colon < slash))
        return {image, "latest"};
    return {image.substr(0, colon), image.substr(colon + 1)};
}

}  // namespace coderun
