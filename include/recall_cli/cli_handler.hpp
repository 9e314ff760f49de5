#pragma once

#include <optional>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace recall_cli
{

  enum class Command
  {
    Ingest,
    Search,
    Job,
    Cancel,
    Delete,
    Documents,
    Repair,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string owner_id;
    std::string document_id;
    std::string file_path;
    std::string source_type = "plain";  // plain | file | page
    std::string link;
    std::string title;
    std::string query;
    std::optional<int> top_k;
    std::string job_id;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments. Throws CliError on missing or unknown flags.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Request body for POST /documents. Pages of `contents` are separated by form feeds.
    static nlohmann::json build_ingestion_body(const CliOptions &options, const std::string &contents);

    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_job_command(const CliOptions &options);
    void handle_cancel_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_documents_command(const CliOptions &options);
    void handle_repair_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform_request(const std::string &method,
                                   const std::string &endpoint,
                                   const std::optional<nlohmann::json> &data);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    std::string escape(const std::string &segment);
    void print_json_response(const nlohmann::json &response);
    void print_search_response(const nlohmann::json &response);
    void print_job_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
