#pragma once

#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docqa_core
{
  class ServiceProvider;
}

namespace docqa_cli
{

  /**
   * @brief Where the CLI's commands run: in this process, or on a docqa_api server.
   *
   * Every method returns the JSON the API would put under "data", so both backends print the
   * same structures.
   */
  class CommandBackend
  {
  public:
    virtual ~CommandBackend() = default;

    // {"results": [IngestResult...], "count": n, "failed": n}
    virtual nlohmann::json ingest(const std::vector<std::string> &paths) = 0;

    // Answer
    virtual nlohmann::json ask(const std::string &question, int top_k) = 0;

    // {"documents": [DocumentSummary...], "count": n}
    virtual nlohmann::json documents() = 0;

    // Returns false if nothing was stored under filename
    virtual bool remove(const std::string &filename) = 0;

    // Sorted names of the ingestible files in dir
    virtual std::vector<std::string> scan(const std::string &dir) = 0;
  };

  class LocalBackend : public CommandBackend
  {
  public:
    explicit LocalBackend(std::shared_ptr<docqa_core::ServiceProvider> services);

    nlohmann::json ingest(const std::vector<std::string> &paths) override;
    nlohmann::json ask(const std::string &question, int top_k) override;
    nlohmann::json documents() override;
    bool remove(const std::string &filename) override;
    std::vector<std::string> scan(const std::string &dir) override;

  private:
    std::shared_ptr<docqa_core::ServiceProvider> services_;
  };

  class HttpBackend : public CommandBackend
  {
  public:
    explicit HttpBackend(const std::string &api_base_url);
    ~HttpBackend() override;

    // Disable copy constructor and assignment
    HttpBackend(const HttpBackend &) = delete;
    HttpBackend &operator=(const HttpBackend &) = delete;

    nlohmann::json ingest(const std::vector<std::string> &paths) override;
    nlohmann::json ask(const std::string &question, int top_k) override;
    nlohmann::json documents() override;
    bool remove(const std::string &filename) override;
    // Scans the local filesystem; the server is not involved
    std::vector<std::string> scan(const std::string &dir) override;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    struct HttpResponse
    {
      long status;
      nlohmann::json body;
    };

    // HTTP methods
    HttpResponse make_get_request(const std::string &endpoint);
    HttpResponse make_post_request(const std::string &endpoint, const nlohmann::json &data);
    HttpResponse make_delete_request(const std::string &endpoint);

    HttpResponse perform(const std::string &endpoint);
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    // Returns "data" of a successful response; throws CliError with the server's error otherwise
    static nlohmann::json unwrap(const HttpResponse &response);
  };

}
