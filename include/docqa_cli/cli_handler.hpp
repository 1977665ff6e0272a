#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docqa_cli
{

  enum class Command
  {
    Upload,
    Url,
    Ask,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::vector<std::string> file_paths;
    std::string url;
    std::string question;
    std::string api_base_url;
    bool verbose = false;
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
    static constexpr const char *DEFAULT_API_URL = "http://127.0.0.1:8000";

    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments; --api-url overrides the base URL
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; throws CliError on any failure
    void execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;
    bool verbose_ = false;

    // Command handlers
    void handle_upload_command(const CliOptions &options);
    void handle_url_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint);
    nlohmann::json make_multipart_request(const std::string &endpoint,
                                          const std::string &field_name,
                                          const std::vector<std::string> &file_paths);
    nlohmann::json perform_request(const std::string &url, std::string &response_buffer);

    // Helper methods
    void setup_curl_handle();
    std::string escape(const std::string &value);
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_status_trail(const nlohmann::json &response);
    void print_answer(const nlohmann::json &response);
    void print_session_status(const nlohmann::json &response);
    void print_help();
  };

}
