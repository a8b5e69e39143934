#include "docqa_cli/command_backend.hpp"
#include "docqa_cli/cli_handler.hpp"

#include <filesystem>

#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/service_provider.hpp"
#include "docqa_core/store/record_codec.hpp"

namespace docqa_cli {

namespace {

nlohmann::json batch_summary(const std::vector<docqa_core::IngestResult>& results) {
    size_t failed = 0;
    for (const auto& result : results) {
        if (!result.ok()) {
            ++failed;
        }
    }
    nlohmann::json data;
    data["results"] = results;
    data["count"] = results.size();
    data["failed"] = failed;
    return data;
}

}  // namespace

// LocalBackend

LocalBackend::LocalBackend(std::shared_ptr<docqa_core::ServiceProvider> services)
    : services_(std::move(services)) {
    if (!services_) {
        throw CliError("LocalBackend requires a service provider");
    }
}

nlohmann::json LocalBackend::ingest(const std::vector<std::string>& paths) {
    std::vector<std::filesystem::path> file_paths(paths.begin(), paths.end());
    return batch_summary(services_->get_ingestion_service().ingest_files(file_paths));
}

nlohmann::json LocalBackend::ask(const std::string& question, int top_k) {
    return services_->get_retrieval_service().answer(question, top_k);
}

nlohmann::json LocalBackend::documents() {
    auto documents = services_->get_document_service().list_documents();
    nlohmann::json data;
    data["documents"] = documents;
    data["count"] = documents.size();
    return data;
}

bool LocalBackend::remove(const std::string& filename) {
    return services_->get_document_service().remove_document(filename);
}

std::vector<std::string> LocalBackend::scan(const std::string& dir) {
    return services_->get_extractor_factory().list_supported_files(dir);
}

// HttpBackend

HttpBackend::HttpBackend(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(curl_easy_init()) {
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

HttpBackend::~HttpBackend() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t HttpBackend::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string HttpBackend::build_url(const std::string& endpoint) const {
    std::string base = api_base_url_;
    if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

nlohmann::json HttpBackend::ingest(const std::vector<std::string>& paths) {
    // The server resolves relative paths against its own working directory
    nlohmann::json absolute_paths = nlohmann::json::array();
    for (const auto& path : paths) {
        absolute_paths.push_back(std::filesystem::absolute(path).string());
    }
    nlohmann::json request_data;
    request_data["paths"] = absolute_paths;
    return unwrap(make_post_request("/ingest/batch", request_data));
}

nlohmann::json HttpBackend::ask(const std::string& question, int top_k) {
    nlohmann::json request_data;
    request_data["question"] = question;
    request_data["k"] = top_k;
    return unwrap(make_post_request("/answer", request_data));
}

nlohmann::json HttpBackend::documents() {
    return unwrap(make_get_request("/documents"));
}

bool HttpBackend::remove(const std::string& filename) {
    char* escaped = curl_easy_escape(curl_handle_, filename.c_str(), static_cast<int>(filename.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode filename: " + filename);
    }
    std::string endpoint = "/documents/" + std::string(escaped);
    curl_free(escaped);

    HttpResponse response = make_delete_request(endpoint);
    if (response.status == 404) {
        return false;
    }
    unwrap(response);
    return true;
}

std::vector<std::string> HttpBackend::scan(const std::string& dir) {
    docqa_core::ContentExtractorFactory factory;
    return factory.list_supported_files(dir);
}

HttpBackend::HttpResponse HttpBackend::make_get_request(const std::string& endpoint) {
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPGET, 1L);
    return perform(endpoint);
}

HttpBackend::HttpResponse HttpBackend::make_post_request(const std::string& endpoint,
                                                         const nlohmann::json& data) {
    std::string request_json = data.dump();
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

    try {
        HttpResponse response = perform(endpoint);
        curl_slist_free_all(headers);
        return response;
    } catch (const CliError&) {
        curl_slist_free_all(headers);
        throw;
    }
}

HttpBackend::HttpResponse HttpBackend::make_delete_request(const std::string& endpoint) {
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    return perform(endpoint);
}

HttpBackend::HttpResponse HttpBackend::perform(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (body.is_discarded()) {
        throw CliError("Invalid JSON response from " + url + " (HTTP " + std::to_string(http_code) +
                       ")");
    }
    return {http_code, body};
}

nlohmann::json HttpBackend::unwrap(const HttpResponse& response) {
    const nlohmann::json& body = response.body;
    if (body.is_object() && body.value("success", false)) {
        return body.value("data", nlohmann::json::object());
    }
    std::string error = "HTTP " + std::to_string(response.status);
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        error += ": " + body["error"].get<std::string>();
    }
    throw CliError(error);
}

}  // namespace docqa_cli
