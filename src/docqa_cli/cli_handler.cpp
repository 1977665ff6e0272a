#include "docqa_cli/cli_handler.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

namespace docqa_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_)
    , verbose_(other.verbose_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        verbose_ = other.verbose_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.api_base_url = api_base_url_;

    // Global options may appear anywhere; everything else is positional
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--api-url" || arg == "-u") {
            if (i + 1 >= argc) {
                throw CliError("--api-url requires a value");
            }
            options.api_base_url = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        options.command = Command::Help;
        return options;
    }

    std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "upload") {
        options.command = Command::Upload;
        if (args.empty()) {
            throw CliError("Upload command requires at least one file. Usage: upload <file>...");
        }
        options.file_paths = args;
    } else if (command == "url") {
        options.command = Command::Url;
        if (args.size() != 1) {
            throw CliError("Url command requires exactly one URL. Usage: url <url>");
        }
        options.url = args.front();
    } else if (command == "ask") {
        options.command = Command::Ask;
        for (const auto& word : args) {
            if (!options.question.empty()) {
                options.question += " ";
            }
            options.question += word;
        }
        if (options.question.find_first_not_of(" \t") == std::string::npos) {
            throw CliError("Ask command requires a question. Usage: ask <question...>");
        }
    } else if (command == "status") {
        options.command = Command::Status;
    } else if (command == "help" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    set_api_base_url(options.api_base_url);
    verbose_ = options.verbose;

    switch (options.command) {
        case Command::Upload:
            handle_upload_command(options);
            break;
        case Command::Url:
            handle_url_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    for (const auto& path : options.file_paths) {
        if (!std::ifstream(path).good()) {
            throw CliError("Cannot read file: " + path);
        }
    }
    std::cout << "Uploading " << options.file_paths.size() << " file(s)..." << std::endl;

    nlohmann::json response =
        make_multipart_request("/upload_documents/", "uploaded_files", options.file_paths);
    print_status_trail(response);
}

void CliHandler::handle_url_command(const CliOptions& options) {
    std::cout << "Processing URL: " << options.url << std::endl;

    nlohmann::json response = make_post_request("/process_url/?url=" + escape(options.url));
    print_status_trail(response);
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    if (verbose_) {
        std::cout << "Question: " << options.question << std::endl;
    }

    nlohmann::json response =
        make_post_request("/ask_question/?question=" + escape(options.question));
    print_answer(response);
}

void CliHandler::handle_status_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/status");
    print_session_status(response);
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(url, response_buffer);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, "");
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(url, response_buffer);
}

nlohmann::json CliHandler::make_multipart_request(const std::string& endpoint,
                                                  const std::string& field_name,
                                                  const std::vector<std::string>& file_paths) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl_handle_),
                                                               curl_mime_free);
    if (!mime) {
        throw CliError("Failed to build multipart request");
    }
    for (const auto& path : file_paths) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field_name.c_str());
        if (curl_mime_filedata(part, path.c_str()) != CURLE_OK) {
            throw CliError("Cannot attach file: " + path);
        }
    }

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(url, response_buffer);
}

nlohmann::json CliHandler::perform_request(const std::string& url, std::string& response_buffer) {
    if (verbose_) {
        std::cout << "Request: " << url << std::endl;
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (verbose_) {
        std::cout << "Response (" << http_code << "): " << response_buffer << std::endl;
    }

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string detail;
        if (!body.is_discarded() && body.is_object() && body.contains("detail") &&
            body["detail"].is_string()) {
            detail = body["detail"].get<std::string>();
        }
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                       (detail.empty() ? "" : " (" + detail + ")"));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned a response that is not JSON");
    }
    return body;
}

std::string CliHandler::escape(const std::string& value) {
    char* escaped = curl_easy_escape(curl_handle_, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode: " + value);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    if (!api_base_url_.empty() && api_base_url_.back() == '/' && !endpoint.empty() &&
        endpoint.front() == '/') {
        return api_base_url_ + endpoint.substr(1);
    }
    return api_base_url_ + endpoint;
}

void CliHandler::print_status_trail(const nlohmann::json& response) {
    std::string trail = response.value("status", "");
    std::cout << trail << std::endl;
    // The trail ends in an "Error: ..." line when ingestion failed
    size_t last_line = trail.rfind('\n');
    std::string final_line = last_line == std::string::npos ? trail : trail.substr(last_line + 1);
    if (final_line.rfind("Error:", 0) == 0) {
        size_t message_start = final_line.find_first_not_of(' ', 6);
        throw CliError(message_start == std::string::npos ? "Ingestion failed"
                                                          : final_line.substr(message_start));
    }
}

void CliHandler::print_answer(const nlohmann::json& response) {
    std::cout << response.value("response", "") << std::endl;

    if (response.contains("sources") && response["sources"].is_array() &&
        !response["sources"].empty()) {
        std::cout << "\nSources:" << std::endl;
        for (const auto& source : response["sources"]) {
            std::cout << "  - " << source.value("source", "unknown");
            if (verbose_) {
                std::cout << " (passage " << source.value("passage_id", 0)
                          << ", score: " << std::fixed << std::setprecision(3)
                          << source.value("score", 0.0f) << ")";
            }
            std::cout << std::endl;
        }
    }
}

void CliHandler::print_session_status(const nlohmann::json& response) {
    std::cout << "State: " << response.value("state", "Unknown") << std::endl;
    std::cout << "Passages: " << response.value("passages", 0) << std::endl;
    if (response.contains("sources") && response["sources"].is_array()) {
        for (const auto& source : response["sources"]) {
            std::cout << "  - " << source.get<std::string>() << std::endl;
        }
    }
}

void CliHandler::print_help() {
    std::cout << R"(
DocQA CLI - Ask questions about your documents

Usage: docqa [options] <command> [arguments]

Commands:
  upload <file>...      Upload and index one or more documents (PDF, Markdown, text)
  url <url>             Download a document and index it
  ask <question...>     Ask a question about the indexed documents
  status                Show what is currently indexed
  help                  Show this help message

Options:
  --api-url, -u <url>   Base URL of the DocQA API (default: http://127.0.0.1:8000)
  --verbose, -v         Print requests, raw responses and passage scores

Environment Variables:
  DOCQA_API_URL         Base URL of the DocQA API

Examples:
  docqa upload report.pdf notes.md
  docqa url https://example.com/paper.pdf
  docqa ask What is the capital of France?
  docqa status
)" << std::endl;
}

} // namespace docqa_cli
